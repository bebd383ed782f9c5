#pragma once

#include <memory>

#include "PrimeEmbed/Embed.h"
#include "PrimeEmbed/HostSurface.h"
#include "PrimeEmbed/NativeWindowApi.h"

namespace PrimeEmbed {

class EmbedLog;
class FocusInputBridge;
class LayoutSubscription;
class LayoutSynchronizer;
class NativeWindowController;
class VisibilitySequencer;

// Host-side element presenting a foreign native window. The window is connected to
// the host only while the element is visible, and follows the element's layout
// while connected.
class EmbeddingSurface final : public SurfaceListener {
public:
  EmbeddingSurface(NativeWindowHandle handle, HostSurface& host, NativeWindowApi& api, const EmbedConfig& config);
  ~EmbeddingSurface() override;

  EmbeddingSurface(const EmbeddingSurface&) = delete;
  EmbeddingSurface& operator=(const EmbeddingSurface&) = delete;

  NativeWindowHandle handle() const;
  EmbeddingState state() const;
  bool isTransitioning() const;
  bool isFocusable() const;

  // The element never asks for space based on native content.
  LogicalSize measure(LogicalSize availableSize) const;
  LogicalSize arrange(LogicalSize finalSize) const;

  void setLogCallback(LogCallback callback);

  void visibilityChanged(bool visible) override;
  void gotFocus() override;
  void previewKeyDown(KeyDownEvent& event) override;

private:
  void layoutUpdated();

  NativeWindowHandle handle_{};
  HostSurface& host_;
  std::unique_ptr<EmbedLog> log_;
  std::unique_ptr<NativeWindowController> controller_;
  std::unique_ptr<LayoutSynchronizer> synchronizer_;
  std::unique_ptr<LayoutSubscription> subscription_;
  std::unique_ptr<FocusInputBridge> bridge_;
  std::unique_ptr<VisibilitySequencer> sequencer_;
};

EmbedResult<std::unique_ptr<EmbeddingSurface>> createEmbeddingSurface(NativeWindowHandle handle,
                                                                      HostSurface& host,
                                                                      NativeWindowApi& api,
                                                                      const EmbedConfig& config = {});

} // namespace PrimeEmbed
