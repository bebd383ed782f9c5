#include "LayoutSynchronizer.h"

#include <utility>

#include "NativeWindowController.h"
#include "PrimeEmbed/CoordinateMapper.h"

namespace PrimeEmbed {

LayoutSubscription::LayoutSubscription(HostSurface& host, std::function<void()> callback)
    : host_(host),
      callback_(std::move(callback)) {}

LayoutSubscription::~LayoutSubscription() {
  unsubscribe();
}

void LayoutSubscription::subscribe() {
  unsubscribe();
  id_ = host_.subscribeLayoutUpdated(callback_);
}

void LayoutSubscription::unsubscribe() {
  if (!id_) {
    return;
  }
  host_.unsubscribeLayoutUpdated(*id_);
  id_.reset();
}

bool LayoutSubscription::isActive() const {
  return id_.has_value();
}

LayoutSynchronizer::LayoutSynchronizer(HostSurface& host, NativeWindowController& controller)
    : host_(host),
      controller_(controller) {}

std::optional<DeviceRect> LayoutSynchronizer::synchronize() {
  auto transform = host_.rootAncestorTransform();
  if (!transform) {
    return std::nullopt;
  }

  LayoutSnapshot snapshot{};
  snapshot.offset = transform->apply(LogicalPoint{});
  snapshot.size = host_.actualSize();
  snapshot.scale = host_.scalingFactor();

  DeviceRect rect = mapToDevice(snapshot);
  controller_.moveResize(rect);
  return rect;
}

} // namespace PrimeEmbed
