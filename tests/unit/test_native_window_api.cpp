#include "PrimeEmbed/PrimeEmbed.h"

#include "tests/unit/test_helpers.h"

using namespace PrimeEmbed;

TEST_SUITE_BEGIN("primeembed.native");

PE_TEST("primeembed.native", "platform api availability") {
  auto apiResult = createNativeWindowApi();
  if (!apiResult) {
    bool allowed = apiResult.error().code == EmbedErrorCode::Unsupported;
    allowed = allowed || apiResult.error().code == EmbedErrorCode::PlatformFailure;
    PE_CHECK(allowed);
    return;
  }
  PE_CHECK(apiResult.value() != nullptr);
}

PE_TEST("primeembed.native", "zero handle rejected") {
  auto apiResult = createNativeWindowApi();
  if (!apiResult) {
    return;
  }
  auto api = std::move(apiResult.value());
  NativeWindowHandle invalid{};

  auto style = api->setChildStyle(invalid);
  PE_CHECK(!style.has_value());
  if (!style) {
    PE_CHECK(style.error().code == EmbedErrorCode::InvalidHandle);
  }

  auto parent = api->setParent(invalid, HostAnchor{});
  PE_CHECK(!parent.has_value());
  auto visible = api->setVisible(invalid, true);
  PE_CHECK(!visible.has_value());
  auto activation = api->sendActivation(invalid, true);
  PE_CHECK(!activation.has_value());
  auto move = api->moveResize(invalid, DeviceRect{0, 0, 10, 10}, true);
  PE_CHECK(!move.has_value());
  auto focus = api->setFocus(invalid);
  PE_CHECK(!focus.has_value());

  auto bounds = api->windowBounds(invalid);
  PE_CHECK(!bounds.has_value());
  if (!bounds) {
    PE_CHECK(bounds.error().code == EmbedErrorCode::InvalidHandle);
  }
}

TEST_SUITE_END();
