#include "VisibilitySequencer.h"

#include <utility>

#include "EmbedLog.h"
#include "LayoutSynchronizer.h"
#include "NativeWindowController.h"

namespace PrimeEmbed {

VisibilitySequencer::VisibilitySequencer(HostSurface& host,
                                         NativeWindowController& controller,
                                         LayoutSubscription& subscription,
                                         const EmbedLog& log,
                                         DevicePoint parkPosition)
    : host_(host),
      controller_(controller),
      subscription_(subscription),
      log_(log),
      parkPosition_(parkPosition) {}

void VisibilitySequencer::requestVisible(bool visible) {
  targetVisible_ = visible;
  if (running_) {
    if (!visible) {
      subscription_.unsubscribe();
    }
    return;
  }
  bool attached = state_ == EmbeddingState::Attached;
  if (visible == attached) {
    return;
  }
  begin(visible);
}

EmbeddingState VisibilitySequencer::state() const {
  return state_;
}

bool VisibilitySequencer::isTransitioning() const {
  return running_;
}

bool VisibilitySequencer::targetVisible() const {
  return targetVisible_;
}

void VisibilitySequencer::begin(bool visible) {
  running_ = true;
  if (visible) {
    queueAttach();
  } else {
    queueDetach();
  }
  runNext();
}

void VisibilitySequencer::queueAttach() {
  // Reparent before show: the window must never be mapped as a top-level.
  steps_.push_back([this] {
    HostAnchor anchor = host_.presentationSurfaceHandle();
    if (!anchor.isValid()) {
      log_.debug("no presentation surface; embedding without parent");
    }
    controller_.reparent(anchor);
  });
  steps_.push_back([this] { controller_.setVisible(true); });
  steps_.push_back([this] { controller_.sendActivationState(true); });
  steps_.push_back([this] {
    if (targetVisible_) {
      subscription_.subscribe();
    }
    state_ = EmbeddingState::Attached;
    log_.debug("embedded window attached");
  });
}

void VisibilitySequencer::queueDetach() {
  steps_.push_back([this] { subscription_.unsubscribe(); });
  steps_.push_back([this] { controller_.sendActivationState(false); });
  steps_.push_back([this] { controller_.setVisible(false); });
  steps_.push_back([this] { park(); });
  steps_.push_back([this] {
    controller_.reparent(HostAnchor{});
    state_ = EmbeddingState::Detached;
    log_.debug("embedded window detached");
  });
}

void VisibilitySequencer::runNext() {
  if (steps_.empty()) {
    settle();
    return;
  }
  Step step = std::move(steps_.front());
  steps_.pop_front();
  step();
  if (steps_.empty()) {
    settle();
    return;
  }
  std::weak_ptr<int> alive = lifetime_;
  host_.post([this, alive] {
    if (alive.expired()) {
      return;
    }
    runNext();
  });
}

void VisibilitySequencer::settle() {
  running_ = false;
  bool attached = state_ == EmbeddingState::Attached;
  if (targetVisible_ != attached) {
    begin(targetVisible_);
  }
}

void VisibilitySequencer::park() {
  auto bounds = controller_.queryBounds();
  if (!bounds) {
    return;
  }
  controller_.moveResize(DeviceRect{parkPosition_.x, parkPosition_.y, bounds->width, bounds->height});
}

} // namespace PrimeEmbed
