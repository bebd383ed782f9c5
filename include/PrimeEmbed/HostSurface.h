#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "PrimeEmbed/Embed.h"

namespace PrimeEmbed {

using LayoutSubscriptionId = uint64_t;

class SurfaceListener {
public:
  virtual ~SurfaceListener() = default;

  virtual void visibilityChanged(bool visible) = 0;
  virtual void gotFocus() = 0;
  virtual void previewKeyDown(KeyDownEvent& event) = 0;
};

// Host side of the embedding: layout, transform and scheduling services for the
// element that presents the foreign window. All calls happen on the host UI thread.
class HostSurface {
public:
  virtual ~HostSurface() = default;

  virtual void setListener(SurfaceListener* listener) = 0;

  virtual LayoutSubscriptionId subscribeLayoutUpdated(std::function<void()> callback) = 0;
  virtual void unsubscribeLayoutUpdated(LayoutSubscriptionId id) = 0;

  // Empty when the element is not part of a presented visual tree.
  virtual std::optional<Transform2D> rootAncestorTransform() const = 0;
  virtual ScaleFactor scalingFactor() const = 0;
  virtual HostAnchor presentationSurfaceHandle() const = 0;
  virtual LogicalSize actualSize() const = 0;

  virtual void post(std::function<void()> task) = 0;
};

} // namespace PrimeEmbed
