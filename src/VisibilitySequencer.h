#pragma once

#include <deque>
#include <functional>
#include <memory>

#include "PrimeEmbed/HostSurface.h"

namespace PrimeEmbed {

class EmbedLog;
class LayoutSubscription;
class NativeWindowController;

// Attach/detach state machine. Each transition is a pipeline of steps: the first runs
// inside the request, the rest are posted to the host one at a time. Transitions never
// interleave; requests made while one is running only update the target, and the next
// pipeline starts when the current one settles.
class VisibilitySequencer {
public:
  VisibilitySequencer(HostSurface& host,
                      NativeWindowController& controller,
                      LayoutSubscription& subscription,
                      const EmbedLog& log,
                      DevicePoint parkPosition);

  VisibilitySequencer(const VisibilitySequencer&) = delete;
  VisibilitySequencer& operator=(const VisibilitySequencer&) = delete;

  void requestVisible(bool visible);

  EmbeddingState state() const;
  bool isTransitioning() const;
  bool targetVisible() const;

private:
  using Step = std::function<void()>;

  void begin(bool visible);
  void queueAttach();
  void queueDetach();
  void runNext();
  void settle();
  void park();

  HostSurface& host_;
  NativeWindowController& controller_;
  LayoutSubscription& subscription_;
  const EmbedLog& log_;
  DevicePoint parkPosition_{};

  EmbeddingState state_ = EmbeddingState::Detached;
  bool targetVisible_ = false;
  bool running_ = false;
  std::deque<Step> steps_;
  std::shared_ptr<int> lifetime_ = std::make_shared<int>(0);
};

} // namespace PrimeEmbed
