#include "bluos/errors.h"
#include "bluos/player_controller.h"

#include "fakes.h"

#include <gtest/gtest.h>

#include <thread>

using namespace bluos;
using namespace bluos::test;

static const char *const SYNC_STATUS = "<SyncStatus name=\"Kitchen\" modelName=\"NODE\" brand=\"Bluesound\"/>";
static const char *const STATUS = "<status><volume>30</volume><state>play</state><title1>Song</title1></status>";

class PlayerControllerTest : public ::testing::Test
{
protected:
  PlayerControllerTest()
      : limiter(std::chrono::milliseconds(0)),
        executor(transport, limiter, fast_policy(), nullptr, [](std::chrono::milliseconds) {}),
        controller(executor, dispatcher, options()), kitchen(make_device("192.168.1.20", "Kitchen"))
  {
  }

  static RetryPolicy fast_policy()
  {
    RetryPolicy policy;
    policy.base_delay = std::chrono::milliseconds(0);
    policy.max_delay = std::chrono::milliseconds(0);
    return policy;
  }

  static ControllerOptions options()
  {
    ControllerOptions o;
    o.status_timeout = std::chrono::milliseconds(3000);
    o.command_timeout = std::chrono::milliseconds(2000);
    o.safe_volume = 14;
    return o;
  }

  HttpRequest last() const { return transport.requests().back(); }

  FakeTransport transport;
  RateLimiter limiter;
  RequestExecutor executor;
  Dispatcher dispatcher;
  PlayerController controller;
  Device kitchen;
};

TEST(PlayerCommand, ParsesNamesAndAliases)
{
  PlayerCommand c = PlayerCommand::Play;
  EXPECT_TRUE(parse_player_command("NEXT", c));
  EXPECT_EQ(PlayerCommand::Skip, c);
  EXPECT_TRUE(parse_player_command("previous", c));
  EXPECT_EQ(PlayerCommand::Back, c);
  EXPECT_TRUE(parse_player_command(" toggle ", c));
  EXPECT_EQ(PlayerCommand::Toggle, c);
  EXPECT_FALSE(parse_player_command("rewind", c));
  EXPECT_STREQ("pause", player_command_name(PlayerCommand::Pause));
}

TEST_F(PlayerControllerTest, TransportCommands)
{
  controller.send(kitchen, PlayerCommand::Play);
  EXPECT_EQ("/Play", last().target);
  EXPECT_EQ(std::chrono::milliseconds(2000), last().timeout);

  controller.send(kitchen, PlayerCommand::Skip);
  EXPECT_EQ("/Skip", last().target);
  controller.send(kitchen, PlayerCommand::Back);
  EXPECT_EQ("/Back", last().target);
  controller.send(kitchen, PlayerCommand::Toggle);
  EXPECT_EQ("/Pause?toggle=1", last().target);
}

TEST_F(PlayerControllerTest, StatusCombinesBothDocuments)
{
  transport.route("/SyncStatus", SYNC_STATUS);
  transport.route("/Status", STATUS);

  int attempts = 0;
  PlayerStatus status = controller.status(kitchen, &attempts);
  EXPECT_EQ("Kitchen", status.sync.name);
  EXPECT_EQ("Bluesound NODE", status.sync.full_model());
  EXPECT_EQ(30, status.playback.volume);
  EXPECT_EQ(PlayState::Play, status.playback.state);
  EXPECT_EQ(2, attempts);
  EXPECT_EQ(std::chrono::milliseconds(3000), last().timeout);
}

TEST_F(PlayerControllerTest, UnreadableStatusIsProtocolError)
{
  transport.route("/SyncStatus", SYNC_STATUS);
  transport.route("/Status", "<!DOCTYPE x><status/>");
  try
  {
    controller.status(kitchen);
    FAIL() << "expected ProtocolError";
  }
  catch (const ProtocolError &e)
  {
    EXPECT_EQ(2, e.attempts);
    EXPECT_EQ("192.168.1.20", e.address);
  }
}

TEST_F(PlayerControllerTest, VolumeCommands)
{
  controller.set_volume(kitchen, 25);
  EXPECT_EQ("/Volume?level=25", last().target);
  controller.set_muted(kitchen, true);
  EXPECT_EQ("/Volume?mute=1", last().target);
  controller.set_muted(kitchen, false);
  EXPECT_EQ("/Volume?mute=0", last().target);
  controller.reset_volume(kitchen);
  EXPECT_EQ("/Volume?level=14", last().target);

  size_t sent = transport.count();
  EXPECT_THROW(controller.set_volume(kitchen, 101), ValidationError);
  EXPECT_THROW(controller.set_volume(kitchen, -1), ValidationError);
  EXPECT_EQ(sent, transport.count());
}

TEST_F(PlayerControllerTest, AdjustVolumeClamps)
{
  transport.route("/Status", STATUS);

  int level = 0;
  Response response = controller.adjust_volume(kitchen, 5, &level);
  EXPECT_EQ(35, level);
  EXPECT_EQ("/Volume?level=35", last().target);
  EXPECT_EQ(2, response.attempts);

  controller.adjust_volume(kitchen, 200, &level);
  EXPECT_EQ(100, level);
  controller.adjust_volume(kitchen, -90, &level);
  EXPECT_EQ(0, level);
  EXPECT_EQ("/Volume?level=0", last().target);
}

TEST_F(PlayerControllerTest, QueueCommands)
{
  transport.route("/Queue", "<playlist><song><title>One</title></song></playlist>");
  std::vector<QueueItem> items = controller.queue(kitchen);
  ASSERT_EQ(1u, items.size());
  EXPECT_EQ("One", items[0].title);

  controller.clear_queue(kitchen);
  EXPECT_EQ("/Queue?clear=1", last().target);
  controller.move_queue_item(kitchen, 3, 0);
  EXPECT_EQ("/Queue?move=3&to=0", last().target);
  EXPECT_THROW(controller.move_queue_item(kitchen, -1, 0), ValidationError);
}

TEST_F(PlayerControllerTest, InputsAndBluetooth)
{
  transport.route("/AudioInputs", "<inputs><input selected=\"1\"><name>Optical</name></input></inputs>");
  transport.route("/AudioModes", "<modes><bluetoothAutoplay>1</bluetoothAutoplay></modes>");

  ASSERT_EQ(1u, controller.inputs(kitchen).size());
  controller.select_input(kitchen, "Optical In");
  EXPECT_EQ("/AudioInput?input=Optical%20In", last().target);
  EXPECT_THROW(controller.select_input(kitchen, "  "), ValidationError);
  EXPECT_THROW(controller.select_input(kitchen, "\xC3"), ValidationError);

  EXPECT_EQ(BluetoothMode::Automatic, controller.bluetooth_mode(kitchen));
  controller.set_bluetooth_mode(kitchen, BluetoothMode::Disabled);
  EXPECT_EQ("/audiomodes?bluetoothAutoplay=3", last().target);
  EXPECT_THROW(controller.set_bluetooth_mode(kitchen, BluetoothMode::Unknown), ValidationError);
}

TEST_F(PlayerControllerTest, Presets)
{
  transport.route("/Presets", "<presets><preset id=\"4\" name=\"Jazz\"/></presets>");
  ASSERT_EQ(1u, controller.presets(kitchen).size());

  controller.play_preset(kitchen, 4);
  EXPECT_EQ("/Preset?id=4", last().target);
  EXPECT_THROW(controller.play_preset(kitchen, 0), ValidationError);
}

TEST_F(PlayerControllerTest, GroupingCommands)
{
  controller.add_slave(kitchen, " 192.168.1.21 ");
  EXPECT_EQ("/Sync?slave=192.168.1.21", last().target);
  controller.remove_slave(kitchen, "192.168.1.21");
  EXPECT_EQ("/Sync?remove=192.168.1.21", last().target);

  EXPECT_THROW(controller.add_slave(kitchen, "192.168.1.20"), ValidationError);
  EXPECT_THROW(controller.add_slave(kitchen, "localhost"), ValidationError);
  EXPECT_THROW(controller.remove_slave(kitchen, "127.0.0.1"), ValidationError);
}

TEST_F(PlayerControllerTest, RebootIsSingleAdminPost)
{
  transport.push_error(ErrorKind::Timeout);
  EXPECT_THROW(controller.reboot(kitchen), TransportError);
  ASSERT_EQ(1u, transport.count());

  HttpRequest sent = last();
  EXPECT_EQ(HttpMethod::Post, sent.method);
  EXPECT_EQ(DEVICE_ADMIN_PORT, sent.port);
  EXPECT_EQ("/Reboot", sent.target);
  EXPECT_EQ("soft=1", sent.body);
}

TEST_F(PlayerControllerTest, HardRebootIsSingleAdminPost)
{
  transport.push_error(ErrorKind::ConnectionReset);
  EXPECT_THROW(controller.hard_reboot(kitchen), TransportError);
  ASSERT_EQ(1u, transport.count());

  HttpRequest sent = last();
  EXPECT_EQ(HttpMethod::Post, sent.method);
  EXPECT_EQ(DEVICE_ADMIN_PORT, sent.port);
  EXPECT_EQ("/reboot", sent.target);
  EXPECT_EQ("yes=1", sent.body);
}

TEST_F(PlayerControllerTest, LeaveGroupRemovesItself)
{
  controller.leave_group(kitchen);
  EXPECT_EQ("/Sync?remove=192.168.1.20", last().target);
  EXPECT_EQ(DEVICE_PORT, last().port);
}

TEST_F(PlayerControllerTest, SystemUptimeFromDiagnosticsPage)
{
  transport.route("/diagnostics", "<html><div class=\"row\"><div>Uptime:</div>\n  <div class=\"v\"> 3 days, 4:05 </div>"
                                  "</div></html>");
  EXPECT_EQ("3 days, 4:05", controller.system_uptime(kitchen).value_or(""));
  EXPECT_EQ(DEVICE_ADMIN_PORT, last().port);
  EXPECT_EQ(HttpMethod::Get, last().method);
  EXPECT_EQ(std::chrono::milliseconds(3000), last().timeout);

  transport.route("/diagnostics", "<html>no rows</html>");
  EXPECT_FALSE(controller.system_uptime(kitchen).has_value());
}

TEST_F(PlayerControllerTest, SystemUptimeIsRetried)
{
  transport.push_error(ErrorKind::Timeout);
  transport.push_response(200, "<div>UPTIME:</div><div>12 min</div>");
  EXPECT_EQ("12 min", controller.system_uptime(kitchen).value_or(""));
  EXPECT_EQ(2u, transport.count());
}

TEST_F(PlayerControllerTest, RawReturnsUndecodedBody)
{
  transport.route("/SyncStatus", SYNC_STATUS);
  EXPECT_EQ(SYNC_STATUS, controller.raw(kitchen, "/SyncStatus"));
  EXPECT_THROW(controller.raw(kitchen, "SyncStatus"), ValidationError);
}

TEST_F(PlayerControllerTest, StatusAllIsolatesFailures)
{
  transport.route("192.168.1.20 /SyncStatus", SYNC_STATUS);
  transport.route("192.168.1.20 /Status", STATUS);
  transport.route("192.168.1.21 /SyncStatus", [](const HttpRequest &req) -> HttpResponse {
    throw TransportError(ErrorKind::ConnectionFailed, "refused", req.host);
  });

  std::map<std::string, Outcome<PlayerStatus>> outcomes =
      controller.status_all({kitchen, make_device("192.168.1.21", "Office")});

  ASSERT_EQ(2u, outcomes.size());
  EXPECT_TRUE(outcomes.at("192.168.1.20").ok);
  EXPECT_EQ("Kitchen", outcomes.at("192.168.1.20").value->sync.name);

  const Outcome<PlayerStatus> &failed = outcomes.at("192.168.1.21");
  EXPECT_FALSE(failed.ok);
  EXPECT_EQ(ErrorKind::ConnectionFailed, failed.error.kind);
  EXPECT_EQ(3, failed.attempts);
}

TEST_F(PlayerControllerTest, RunAllReportsPerDevice)
{
  transport.route("192.168.1.21 /Play", [](const HttpRequest &) {
    HttpResponse r;
    r.status = 404;
    return r;
  });

  std::map<std::string, CommandOutcome> outcomes =
      controller.run_all({kitchen, make_device("192.168.1.21")},
                         [this](const Device &d) { return controller.send(d, PlayerCommand::Play); });

  EXPECT_TRUE(outcomes.at("192.168.1.20").ok);
  EXPECT_EQ(1, outcomes.at("192.168.1.20").attempts);
  EXPECT_FALSE(outcomes.at("192.168.1.21").ok);
  EXPECT_EQ(ErrorKind::Device, outcomes.at("192.168.1.21").error.kind);
}

TEST_F(PlayerControllerTest, RunAllRunsDevicesInParallelAndIsolatesFailure)
{
  const std::chrono::milliseconds delay(300);
  transport.route("/Play", [delay](const HttpRequest &req) -> HttpResponse {
    std::this_thread::sleep_for(delay);
    if (req.host == "192.168.1.13")
      throw TransportError(ErrorKind::ConnectionFailed, "refused", req.host);
    return ok_response();
  });

  std::vector<Device> devices;
  for (int i = 10; i < 16; ++i)
    devices.push_back(make_device("192.168.1." + std::to_string(i)));

  auto start = std::chrono::steady_clock::now();
  std::map<std::string, CommandOutcome> outcomes =
      controller.run_all(devices, [this](const Device &d) { return controller.send(d, PlayerCommand::Play); });
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(6u, outcomes.size());
  int succeeded = 0;
  for (const auto &pair : outcomes)
  {
    if (pair.second.ok)
      succeeded++;
  }
  EXPECT_EQ(5, succeeded);

  const CommandOutcome &failed = outcomes.at("192.168.1.13");
  EXPECT_FALSE(failed.ok);
  EXPECT_EQ(ErrorKind::ConnectionFailed, failed.error.kind);
  EXPECT_EQ(3, failed.attempts);

  // The failing device retries three times; everything else overlaps it.
  EXPECT_GE(elapsed, 3 * delay);
  EXPECT_LT(elapsed, 3 * delay + std::chrono::milliseconds(700));
}

TEST(GroupChange, ResolvesMasterAndSlavesByNameOrAddress)
{
  std::vector<Device> devices = {make_device("192.168.1.20", "Kitchen"), make_device("192.168.1.21", "Office"),
                                 make_device("192.168.1.22", "Office Annex")};

  GroupChange change = plan_group_change(devices, "kitchen", {"office", "192.168.1.30", " 192.168.1.21 "});
  EXPECT_EQ("192.168.1.20", change.master.address);
  EXPECT_EQ((std::vector<std::string>{"192.168.1.21", "192.168.1.30"}), change.slaves);
}

TEST(GroupChange, RefusesAmbiguousOrMissingTargets)
{
  std::vector<Device> devices = {make_device("192.168.1.20", "Kitchen"), make_device("192.168.1.21", "Office"),
                                 make_device("192.168.1.22", "Office Annex")};

  EXPECT_THROW(plan_group_change(devices, "", {"office"}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "off", {"kitchen"}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "garage", {"office"}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "kitchen", {}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "kitchen", {"off"}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "kitchen", {"192.168.1.20"}), ValidationError);
  EXPECT_THROW(plan_group_change(devices, "kitchen", {"Kitchen"}), ValidationError);
}

TEST(ControllerOptions, FollowSettings)
{
  Settings s = default_settings();
  s.status_timeout = std::chrono::milliseconds(4500);
  s.safe_volume = 9;
  ControllerOptions o = controller_options(s);
  EXPECT_EQ(std::chrono::milliseconds(4500), o.status_timeout);
  EXPECT_EQ(9, o.safe_volume);
}
