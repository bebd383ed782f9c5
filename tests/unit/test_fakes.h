#pragma once

#include "PrimeEmbed/PrimeEmbed.h"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PrimeEmbed::testing {

// Shared, ordered record of native commands and host subscription changes.
using Journal = std::vector<std::string>;

inline std::string rect_text(const DeviceRect& rect) {
  return std::to_string(rect.x) + "," + std::to_string(rect.y) + "," + std::to_string(rect.width) + "," +
         std::to_string(rect.height);
}

class RecordingNativeWindowApi final : public NativeWindowApi {
public:
  explicit RecordingNativeWindowApi(Journal& journal)
      : journal_(journal) {}

  EmbedStatus setChildStyle(NativeWindowHandle window) override {
    journal_.push_back("style " + std::to_string(window.value));
    return commandStatus();
  }

  EmbedStatus setParent(NativeWindowHandle window, HostAnchor parent) override {
    (void)window;
    journal_.push_back("parent " + std::to_string(parent.value));
    return commandStatus();
  }

  EmbedStatus setVisible(NativeWindowHandle window, bool visible) override {
    (void)window;
    journal_.push_back(visible ? "show" : "hide");
    return commandStatus();
  }

  EmbedStatus sendActivation(NativeWindowHandle window, bool active) override {
    (void)window;
    journal_.push_back(active ? "activate" : "deactivate");
    return commandStatus();
  }

  EmbedStatus moveResize(NativeWindowHandle window, const DeviceRect& rect, bool repaint) override {
    (void)window;
    lastRepaint = repaint;
    journal_.push_back("move " + rect_text(rect));
    return commandStatus();
  }

  EmbedResult<DeviceRect> windowBounds(NativeWindowHandle window) const override {
    (void)window;
    journal_.push_back("bounds");
    if (failBounds) {
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    return bounds;
  }

  EmbedStatus setFocus(NativeWindowHandle window) override {
    journal_.push_back("focus " + std::to_string(window.value));
    return commandStatus();
  }

  DeviceRect bounds{10, 20, 640, 480};
  bool failBounds = false;
  bool failCommands = false;
  bool lastRepaint = false;

private:
  EmbedStatus commandStatus() const {
    if (failCommands) {
      return std::unexpected(EmbedError{EmbedErrorCode::PlatformFailure});
    }
    return {};
  }

  Journal& journal_;
};

class FakeHostSurface final : public HostSurface {
public:
  explicit FakeHostSurface(Journal& journal)
      : journal_(journal) {}

  void setListener(SurfaceListener* listener) override { listener_ = listener; }

  LayoutSubscriptionId subscribeLayoutUpdated(std::function<void()> callback) override {
    journal_.push_back("subscribe");
    LayoutSubscriptionId id = nextId_++;
    subscriptions_[id] = std::move(callback);
    return id;
  }

  void unsubscribeLayoutUpdated(LayoutSubscriptionId id) override {
    journal_.push_back("unsubscribe");
    subscriptions_.erase(id);
  }

  std::optional<Transform2D> rootAncestorTransform() const override { return transform; }
  ScaleFactor scalingFactor() const override { return scale; }
  HostAnchor presentationSurfaceHandle() const override { return anchor; }
  LogicalSize actualSize() const override { return size; }

  void post(std::function<void()> task) override {
    if (deferPosts) {
      posted_.push_back(std::move(task));
      return;
    }
    task();
  }

  bool runOne() {
    if (posted_.empty()) {
      return false;
    }
    auto task = std::move(posted_.front());
    posted_.pop_front();
    task();
    return true;
  }

  size_t runAll() {
    size_t count = 0u;
    while (runOne()) {
      ++count;
    }
    return count;
  }

  void fireLayoutUpdated() {
    std::vector<std::function<void()>> callbacks;
    for (const auto& entry : subscriptions_) {
      callbacks.push_back(entry.second);
    }
    for (const auto& callback : callbacks) {
      callback();
    }
  }

  void setVisible(bool visible) {
    if (listener_) {
      listener_->visibilityChanged(visible);
    }
  }

  void focus() {
    if (listener_) {
      listener_->gotFocus();
    }
  }

  bool keyDown(uint32_t keyCode) {
    KeyDownEvent event{};
    event.keyCode = keyCode;
    if (listener_) {
      listener_->previewKeyDown(event);
    }
    return event.handled;
  }

  SurfaceListener* listener() const { return listener_; }
  size_t subscriptionCount() const { return subscriptions_.size(); }
  size_t pendingPosts() const { return posted_.size(); }

  std::optional<Transform2D> transform = Transform2D{};
  ScaleFactor scale{};
  HostAnchor anchor{77u};
  LogicalSize size{};
  bool deferPosts = false;

private:
  Journal& journal_;
  SurfaceListener* listener_ = nullptr;
  std::map<LayoutSubscriptionId, std::function<void()>> subscriptions_;
  LayoutSubscriptionId nextId_ = 1u;
  std::deque<std::function<void()>> posted_;
};

inline size_t index_of(const Journal& journal, const std::string& entry) {
  for (size_t i = 0u; i < journal.size(); ++i) {
    if (journal[i] == entry) {
      return i;
    }
  }
  return journal.size();
}

inline size_t count_of(const Journal& journal, const std::string& entry) {
  size_t count = 0u;
  for (const auto& item : journal) {
    if (item == entry) {
      ++count;
    }
  }
  return count;
}

} // namespace PrimeEmbed::testing
