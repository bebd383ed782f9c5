#include "src/EmbedLog.h"
#include "src/NativeWindowController.h"

#include "tests/unit/test_fakes.h"
#include "tests/unit/test_helpers.h"

#include <string>
#include <vector>

using namespace PrimeEmbed;
using namespace PrimeEmbed::testing;

TEST_SUITE_BEGIN("primeembed.controller");

PE_TEST("primeembed.controller", "commands forward to the bound window") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  EmbedLog log;
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, true);

  controller.configureAsChildStyle();
  controller.reparent(HostAnchor{7u});
  controller.setVisible(true);
  controller.sendActivationState(true);
  controller.moveResize(DeviceRect{1, 2, 3, 4});
  controller.setFocus();
  controller.reparent(HostAnchor{});

  Journal expected{"style 42", "parent 7", "show", "activate", "move 1,2,3,4", "focus 42", "parent 0"};
  PE_CHECK(journal == expected);
  PE_CHECK(controller.handle() == NativeWindowHandle{42u});
  PE_CHECK(api.lastRepaint);
}

PE_TEST("primeembed.controller", "child style can be applied again") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  EmbedLog log;
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, true);

  controller.configureAsChildStyle();
  controller.configureAsChildStyle();
  PE_CHECK(count_of(journal, "style 42") == 2u);
}

PE_TEST("primeembed.controller", "repaint follows config") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  EmbedLog log;
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, false);

  api.lastRepaint = true;
  controller.moveResize(DeviceRect{0, 0, 10, 10});
  PE_CHECK(!api.lastRepaint);
}

PE_TEST("primeembed.controller", "command failures are logged not raised") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  api.failCommands = true;

  std::vector<std::string> messages;
  std::vector<LogLevel> levels;
  EmbedLog log;
  log.setCallback([&](LogLevel level, Utf8TextView message) {
    levels.push_back(level);
    messages.emplace_back(message);
  });
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, true);

  controller.setVisible(true);
  controller.moveResize(DeviceRect{0, 0, 1, 1});

  PE_CHECK(journal.size() == 2u);
  PE_CHECK(messages.size() == 2u);
  if (messages.size() == 2u) {
    PE_CHECK(messages[0] == "setVisible failed (code 1)");
    PE_CHECK(messages[1] == "moveResize failed (code 1)");
  }
  for (auto level : levels) {
    PE_CHECK(level == LogLevel::Debug);
  }
}

PE_TEST("primeembed.controller", "successful commands stay quiet") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  size_t logged = 0u;
  EmbedLog log;
  log.setCallback([&](LogLevel, Utf8TextView) { ++logged; });
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, true);

  controller.setVisible(false);
  controller.setFocus();
  PE_CHECK(logged == 0u);
}

PE_TEST("primeembed.controller", "bounds query reports failure") {
  Journal journal;
  RecordingNativeWindowApi api(journal);
  EmbedLog log;
  NativeWindowController controller(api, NativeWindowHandle{42u}, log, true);

  auto bounds = controller.queryBounds();
  PE_CHECK(bounds.has_value());
  if (bounds) {
    PE_CHECK(*bounds == DeviceRect{10, 20, 640, 480});
  }

  api.failBounds = true;
  auto failed = controller.queryBounds();
  PE_CHECK(!failed.has_value());
  if (!failed) {
    PE_CHECK(failed.error().code == EmbedErrorCode::PlatformFailure);
  }
}

TEST_SUITE_END();
