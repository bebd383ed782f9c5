#pragma once

#include <functional>
#include <optional>

#include "PrimeEmbed/HostSurface.h"

namespace PrimeEmbed {

class NativeWindowController;

// Single-slot registration for the host layout-updated notification.
class LayoutSubscription {
public:
  LayoutSubscription(HostSurface& host, std::function<void()> callback);
  ~LayoutSubscription();

  LayoutSubscription(const LayoutSubscription&) = delete;
  LayoutSubscription& operator=(const LayoutSubscription&) = delete;

  void subscribe();
  void unsubscribe();
  bool isActive() const;

private:
  HostSurface& host_;
  std::function<void()> callback_;
  std::optional<LayoutSubscriptionId> id_;
};

class LayoutSynchronizer {
public:
  LayoutSynchronizer(HostSurface& host, NativeWindowController& controller);

  // Returns the bounds that were applied, or nothing when the surface is not in a
  // presented visual tree.
  std::optional<DeviceRect> synchronize();

private:
  HostSurface& host_;
  NativeWindowController& controller_;
};

} // namespace PrimeEmbed
