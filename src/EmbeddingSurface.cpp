#include "PrimeEmbed/EmbeddingSurface.h"

#include <utility>

#include "EmbedLog.h"
#include "FocusInputBridge.h"
#include "LayoutSynchronizer.h"
#include "NativeWindowController.h"
#include "PrimeEmbed/EmbedConfigValidation.h"
#include "VisibilitySequencer.h"

namespace PrimeEmbed {

EmbeddingSurface::EmbeddingSurface(NativeWindowHandle handle,
                                   HostSurface& host,
                                   NativeWindowApi& api,
                                   const EmbedConfig& config)
    : handle_(handle),
      host_(host),
      log_(std::make_unique<EmbedLog>()) {
  controller_ = std::make_unique<NativeWindowController>(api, handle_, *log_, config.repaintOnMove);
  synchronizer_ = std::make_unique<LayoutSynchronizer>(host_, *controller_);
  subscription_ = std::make_unique<LayoutSubscription>(host_, [this] { layoutUpdated(); });
  bridge_ = std::make_unique<FocusInputBridge>(*controller_);
  sequencer_ = std::make_unique<VisibilitySequencer>(host_, *controller_, *subscription_, *log_, config.parkPosition);

  controller_->configureAsChildStyle();
  host_.setListener(this);
}

EmbeddingSurface::~EmbeddingSurface() {
  host_.setListener(nullptr);
  sequencer_.reset();
  subscription_.reset();
}

NativeWindowHandle EmbeddingSurface::handle() const {
  return handle_;
}

EmbeddingState EmbeddingSurface::state() const {
  return sequencer_->state();
}

bool EmbeddingSurface::isTransitioning() const {
  return sequencer_->isTransitioning();
}

bool EmbeddingSurface::isFocusable() const {
  return true;
}

LogicalSize EmbeddingSurface::measure(LogicalSize availableSize) const {
  (void)availableSize;
  return LogicalSize{};
}

LogicalSize EmbeddingSurface::arrange(LogicalSize finalSize) const {
  return finalSize;
}

void EmbeddingSurface::setLogCallback(LogCallback callback) {
  log_->setCallback(std::move(callback));
}

void EmbeddingSurface::visibilityChanged(bool visible) {
  sequencer_->requestVisible(visible);
}

void EmbeddingSurface::gotFocus() {
  bridge_->gotFocus();
}

void EmbeddingSurface::previewKeyDown(KeyDownEvent& event) {
  bridge_->previewKeyDown(event);
}

void EmbeddingSurface::layoutUpdated() {
  synchronizer_->synchronize();
}

EmbedResult<std::unique_ptr<EmbeddingSurface>> createEmbeddingSurface(NativeWindowHandle handle,
                                                                      HostSurface& host,
                                                                      NativeWindowApi& api,
                                                                      const EmbedConfig& config) {
  auto handleStatus = validateEmbedHandle(handle);
  if (!handleStatus) {
    return std::unexpected(handleStatus.error());
  }
  auto configStatus = validateEmbedConfig(config);
  if (!configStatus) {
    return std::unexpected(configStatus.error());
  }
  return std::make_unique<EmbeddingSurface>(handle, host, api, config);
}

} // namespace PrimeEmbed
