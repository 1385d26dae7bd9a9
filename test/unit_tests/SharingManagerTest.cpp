#include "FakeRelayClient.hpp"
#include "FakeScheduler.hpp"
#include "FakeSessionProvider.hpp"
#include "FakeShareSocket.hpp"
#include "RecordingListener.hpp"
#include "SharingManager.hpp"

#include "TestHeaders.hpp"

using namespace ts;

namespace {
class SharingManagerFixture {
 public:
  SharingManagerFixture()
      : sessions(new FakeSessionProvider()),
        relay(new FakeRelayClient()),
        sockets(new FakeShareSocketFactory()),
        scheduler(new FakeScheduler()),
        listener(new RecordingListener()) {
    sessions->addSession("session-1", "Build");
    sessions->addSession("session-2", "Old", "ended");
    relay->addResolvable("ABCD12", "room-9");
    context.sessionProvider = sessions;
    context.relay = relay;
    context.socketFactory = sockets;
    context.scheduler = scheduler;
    context.listener = listener;
    context.apiKey = "key-123";

    string pattern = GetTempDirectory() + string("ts_manager_XXXXXXXX");
    settingsDirectory = string(mkdtemp(&pattern[0]));
    settings.reset(new SettingsStore(settingsDirectory + "/settings.json"));
  }

  ~SharingManagerFixture() {
    manager.reset();
    fs::remove_all(settingsDirectory);
  }

  void createManager() {
    manager.reset(new SharingManager(context, relay, settings));
  }

  ShareResult start(const string& sessionId,
                    const optional<string>& password = nullopt,
                    const optional<int64_t>& expiresInMs = nullopt) {
    StartShareRequest request;
    request.sessionId = sessionId;
    request.password = password;
    request.expiresInMs = expiresInMs;
    return manager->startShare(request, &lastInfo);
  }

  ShareResult join(const string& codeOrUrl,
                   const optional<string>& displayName = nullopt) {
    JoinShareRequest request;
    request.codeOrUrl = codeOrUrl;
    request.displayName = displayName;
    return manager->joinShare(request);
  }

 protected:
  shared_ptr<FakeSessionProvider> sessions;
  shared_ptr<FakeRelayClient> relay;
  shared_ptr<FakeShareSocketFactory> sockets;
  shared_ptr<FakeScheduler> scheduler;
  shared_ptr<RecordingListener> listener;
  SharingContext context;
  string settingsDirectory;
  shared_ptr<SettingsStore> settings;
  ShareInfo lastInfo;
  unique_ptr<SharingManager> manager;
};

optional<ShareErrorCode> code(ShareErrorCode value) { return value; }

optional<ShareErrorCode> errorCodeOf(const ShareResult& result) {
  return result.errorCode;
}
}  // namespace

TEST_CASE_METHOD(SharingManagerFixture, "Sharing eligibility",
                 "[SharingManager]") {
  createManager();

  SECTION("Pro accounts may share") {
    Eligibility eligibility = manager->checkEligibility();
    REQUIRE(eligibility.eligible);
    REQUIRE(eligibility.plan == optional<string>("pro"));
  }

  SECTION("No account") {
    relay->account.reset();
    Eligibility eligibility = manager->checkEligibility();
    REQUIRE_FALSE(eligibility.eligible);
    REQUIRE(eligibility.reason == optional<string>("No account connected"));
  }

  SECTION("Free plan") {
    relay->account->set_plan("free");
    Eligibility eligibility = manager->checkEligibility();
    REQUIRE_FALSE(eligibility.eligible);
    REQUIRE(eligibility.plan == optional<string>("free"));
    REQUIRE(eligibility.reason ==
            optional<string>("Session sharing requires a Pro subscription"));
  }

  SECTION("Lookup failure") {
    relay->accountThrows = true;
    Eligibility eligibility = manager->checkEligibility();
    REQUIRE_FALSE(eligibility.eligible);
    REQUIRE(eligibility.reason ==
            optional<string>("Failed to verify subscription status"));
  }
}

TEST_CASE_METHOD(SharingManagerFixture, "Starting a share",
                 "[SharingManager]") {
  SECTION("Success") {
    createManager();
    ShareResult result = start("session-1");
    REQUIRE(result.success);
    REQUIRE(lastInfo.sharecode() == "SHARE1");
    REQUIRE(lastInfo.sessionid() == "session-1");
    REQUIRE_FALSE(lastInfo.haspassword());
    REQUIRE(relay->createRequests.size() == 1);
    REQUIRE(relay->createRequests[0].sessionname() == "Build");
    REQUIRE_FALSE(relay->createRequests[0].has_expiresinms());
    REQUIRE(listener->started.size() == 1);
    REQUIRE(manager->getShareInfo("session-1"));
    REQUIRE(manager->listActiveShares().size() == 1);

    ShareResult again = start("session-1");
    REQUIRE(errorCodeOf(again) == code(ShareErrorCode::ALREADY_SHARED));
    REQUIRE(relay->createRequests.size() == 1);
  }

  SECTION("Unknown session") {
    createManager();
    REQUIRE(errorCodeOf(start("missing")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
  }

  SECTION("Session not running") {
    createManager();
    REQUIRE(errorCodeOf(start("session-2")) ==
            code(ShareErrorCode::SESSION_NOT_RUNNING));
  }

  SECTION("No api key") {
    context.apiKey = "";
    createManager();
    REQUIRE(errorCodeOf(start("session-1")) == code(ShareErrorCode::NO_API_KEY));
    REQUIRE(relay->createRequests.empty());
  }

  SECTION("Ineligible accounts") {
    relay->account->set_plan("free");
    createManager();
    REQUIRE(errorCodeOf(start("session-1")) ==
            code(ShareErrorCode::NOT_SUBSCRIBED));
    REQUIRE(relay->createRequests.empty());

    // The session is not left reserved
    relay->account->set_plan("team");
    REQUIRE(start("session-1").success);
  }

  SECTION("Password protected") {
    createManager();
    REQUIRE(start("session-1", string("pw")).success);
    REQUIRE(relay->createRequests[0].password() == "pw");
    REQUIRE(lastInfo.haspassword());
  }

  SECTION("Relay errors are mapped") {
    relay->createErrors.push_back(RelayError(401, "bad key"));
    createManager();
    ShareResult result = start("session-1");
    REQUIRE(errorCodeOf(result) == code(ShareErrorCode::INVALID_API_KEY));
    REQUIRE(manager->listActiveShares().empty());
    REQUIRE(start("session-1").success);
  }

  SECTION("Unreadable relay responses") {
    relay->malformedCreates = 1;
    createManager();
    ShareResult result = start("session-1");
    REQUIRE_FALSE(result.success);
    REQUIRE(errorCodeOf(result) == code(ShareErrorCode::RELAY_ERROR));
    REQUIRE(manager->listActiveShares().empty());

    // The reservation was released, so a retry goes through
    REQUIRE(start("session-1").success);
    REQUIRE(relay->createRequests.size() == 2);
  }

  SECTION("Session ends while the room is created") {
    relay->duringCreate = [this]() { sessions->endSession("session-1"); };
    createManager();
    ShareResult result = start("session-1");
    REQUIRE(errorCodeOf(result) == code(ShareErrorCode::SESSION_NOT_RUNNING));
    REQUIRE(relay->deletedRooms == vector<string>({"room-1"}));
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
    REQUIRE(listener->started.empty());
    REQUIRE(sockets->count() == 0);
    REQUIRE(sessions->subscriberCount("session-1") == 0);

    relay->duringCreate = nullptr;
    sessions->addSession("session-1", "Build");
    REQUIRE(start("session-1").success);
  }

  SECTION("Room limit triggers a cleanup and one retry") {
    relay->rooms = {"orphan-1"};
    relay->createErrors.push_back(
        RelayError(403, "{\"code\":\"TIER_LIMIT_EXCEEDED\"}"));
    createManager();
    REQUIRE(start("session-1").success);
    REQUIRE(relay->deletedRooms == vector<string>({"orphan-1"}));
    REQUIRE(relay->createRequests.size() == 2);
  }

  SECTION("Room limit without stale rooms fails") {
    relay->createErrors.push_back(
        RelayError(403, "{\"code\":\"TIER_LIMIT_EXCEEDED\"}"));
    createManager();
    REQUIRE(errorCodeOf(start("session-1")) ==
            code(ShareErrorCode::INVALID_API_KEY));
    REQUIRE(relay->createRequests.size() == 1);
  }

  SECTION("Default expiry comes from the settings") {
    createManager();
    SharingSettingsUpdate update;
    update.autoExpireMs = 20000;
    manager->updateSettings(update);
    REQUIRE(start("session-1").success);
    REQUIRE(relay->createRequests[0].expiresinms() == 20000);

    sockets->last()->simulateOpen();
    scheduler->advance(20000);
    REQUIRE(listener->stopped.size() == 1);
    REQUIRE(listener->stopped[0].reason == StopReason::EXPIRED);
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
  }

  SECTION("Explicit expiry wins") {
    createManager();
    SharingSettingsUpdate update;
    update.autoExpireMs = 60000;
    manager->updateSettings(update);
    REQUIRE(start("session-1", nullopt, int64_t(5000)).success);
    REQUIRE(relay->createRequests[0].expiresinms() == 5000);
  }
}

TEST_CASE_METHOD(SharingManagerFixture, "Managing hosted shares",
                 "[SharingManager]") {
  createManager();

  SECTION("Operations on unshared sessions") {
    ShareResult stopped = manager->stopShare("session-1");
    REQUIRE(errorCodeOf(stopped) == code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(stopped.message == "Session is not being shared");
    REQUIRE(errorCodeOf(manager->kickObserver("session-1", "o")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(errorCodeOf(manager->grantControl("session-1", "o")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(errorCodeOf(manager->revokeControl("session-1", "o")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
  }

  SECTION("Stopping") {
    REQUIRE(start("session-1").success);
    REQUIRE(manager->stopShare("session-1").success);
    REQUIRE(relay->deletedRooms == vector<string>({"room-1"}));
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
    REQUIRE(listener->stopped.size() == 1);
    REQUIRE(listener->stopped[0].reason == StopReason::HOST_STOPPED);

    REQUIRE(start("session-1").success);
    REQUIRE(lastInfo.sharecode() == "SHARE2");
  }

  SECTION("Ended sessions stop their share") {
    REQUIRE(start("session-1").success);
    sessions->endSession("session-1");
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
    REQUIRE(relay->deletedRooms == vector<string>({"room-1"}));
    REQUIRE(listener->stopped.size() == 1);
  }

  SECTION("Failed shares leave the registry") {
    REQUIRE(start("session-1").success);
    shared_ptr<FakeShareSocket> socket = sockets->last();
    socket->simulateOpen();
    socket->simulateClose(ABNORMAL_CLOSURE);
    REQUIRE_FALSE(manager->getShareInfo("session-1"));
    REQUIRE(listener->stopped[0].reason == StopReason::ERROR);
  }

  SECTION("Output and control go to the right share") {
    REQUIRE(start("session-1").success);
    shared_ptr<FakeShareSocket> socket = sockets->last();
    socket->simulateOpen();
    manager->broadcastOutput("session-1", "make\n");
    manager->broadcastOutput("session-9", "ignored");
    vector<Frame> data = socket->sentFramesOfType(FrameType::TERMINAL_DATA);
    REQUIRE(data.size() == 1);
    REQUIRE(data[0].getPayload() == "make\n");

    socket->simulateFrame(FrameType::OBSERVER_ANNOUNCE,
                          "{\"observerId\":\"obs-1\",\"displayName\":\"A\"}");
    REQUIRE(manager->grantControl("session-1", "obs-1").success);
    REQUIRE(manager->getShareInfo("session-1")->observers(0).role() ==
            HAS_CONTROL);
    REQUIRE(manager->revokeControl("session-1", "obs-1").success);
    REQUIRE(manager->kickObserver("session-1", "obs-1").success);
    REQUIRE(manager->getShareInfo("session-1")->observers_size() == 0);
  }

  SECTION("Stale room cleanup keeps live rooms") {
    REQUIRE(start("session-1").success);
    relay->rooms.push_back("stale-1");
    relay->rooms.push_back("stale-2");
    REQUIRE(manager->cleanupStaleShares() == 2);
    REQUIRE(relay->deletedRooms == vector<string>({"stale-1", "stale-2"}));
    REQUIRE(relay->rooms == vector<string>({"room-1"}));

    relay->listError = RelayError(500, "down");
    REQUIRE(manager->cleanupStaleShares() == 0);
  }
}

TEST_CASE_METHOD(SharingManagerFixture, "Joining shares", "[SharingManager]") {
  SECTION("Invalid codes") {
    createManager();
    REQUIRE(errorCodeOf(join("no!")) == code(ShareErrorCode::INVALID_CODE));
    REQUIRE(relay->resolvedCodes.empty());
  }

  SECTION("Codes and urls are normalized") {
    createManager();
    REQUIRE(join("https://share.example.com/s/abcd12").success);
    vector<JoinedShare> joined = manager->listJoinedShares();
    REQUIRE(joined.size() == 1);
    REQUIRE(joined[0].shareCode == "ABCD12");
    REQUIRE(joined[0].shareId == "room-9");

    ShareResult again = join("abcd12");
    REQUIRE(errorCodeOf(again) == code(ShareErrorCode::ALREADY_SHARED));
    REQUIRE(again.message == "Already joined this session");
  }

  SECTION("No api key") {
    context.apiKey = "";
    createManager();
    REQUIRE(errorCodeOf(join("ABCD12")) == code(ShareErrorCode::NO_API_KEY));
  }

  SECTION("Failed joins are forgotten") {
    createManager();
    REQUIRE(errorCodeOf(join("WXYZ12")) == code(ShareErrorCode::INVALID_CODE));
    REQUIRE(manager->listJoinedShares().empty());
  }

  SECTION("Unreadable resolve responses") {
    relay->malformedResolve = true;
    createManager();
    ShareResult result = join("ABCD12");
    REQUIRE(errorCodeOf(result) == code(ShareErrorCode::RELAY_ERROR));
    REQUIRE(manager->listJoinedShares().empty());
    REQUIRE(sockets->count() == 0);

    relay->malformedResolve = false;
    REQUIRE(join("ABCD12").success);
  }

  SECTION("Shares are listed once resolved") {
    createManager();
    size_t listedWhileResolving = 99;
    relay->duringResolve = [this, &listedWhileResolving]() {
      listedWhileResolving = manager->listJoinedShares().size();
    };
    REQUIRE(join("ABCD12").success);
    REQUIRE(listedWhileResolving == 0);
    vector<JoinedShare> joined = manager->listJoinedShares();
    REQUIRE(joined.size() == 1);
    REQUIRE(joined[0].sessionName == "Remote session");
  }

  SECTION("Display names") {
    createManager();
    REQUIRE(join("ABCD12").success);
    sockets->last()->simulateOpen();
    json announced = json::parse(
        sockets->last()
            ->sentFramesOfType(FrameType::OBSERVER_ANNOUNCE)[0]
            .getPayload());
    REQUIRE(announced["displayName"] == "TermShare User");
    REQUIRE(manager->leaveShare("ABCD12").success);

    SharingSettingsUpdate update;
    update.displayName = string("Zed");
    manager->updateSettings(update);
    REQUIRE(join("ABCD12").success);
    sockets->last()->simulateOpen();
    announced = json::parse(
        sockets->last()
            ->sentFramesOfType(FrameType::OBSERVER_ANNOUNCE)[0]
            .getPayload());
    REQUIRE(announced["displayName"] == "Zed");
    REQUIRE(manager->leaveShare("ABCD12").success);

    REQUIRE(join("ABCD12", string("Bob")).success);
    sockets->last()->simulateOpen();
    announced = json::parse(
        sockets->last()
            ->sentFramesOfType(FrameType::OBSERVER_ANNOUNCE)[0]
            .getPayload());
    REQUIRE(announced["displayName"] == "Bob");
  }
}

TEST_CASE_METHOD(SharingManagerFixture, "Observer operations",
                 "[SharingManager]") {
  createManager();

  SECTION("Unknown shares") {
    ShareResult result = manager->requestControl("ABCD12");
    REQUIRE(errorCodeOf(result) == code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(result.message == "Not joined to this session");
    REQUIRE(errorCodeOf(manager->releaseControl("ABCD12")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(errorCodeOf(manager->sendInput("ABCD12", "x")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
    REQUIRE(errorCodeOf(manager->leaveShare("ABCD12")) ==
            code(ShareErrorCode::SESSION_NOT_FOUND));
  }

  SECTION("Control round trip") {
    REQUIRE(join("ABCD12").success);
    shared_ptr<FakeShareSocket> socket = sockets->last();
    // Not connected yet; lower case codes still find the share
    REQUIRE(errorCodeOf(manager->requestControl("abcd12")) ==
            code(ShareErrorCode::NETWORK_ERROR));

    socket->simulateOpen();
    REQUIRE(manager->requestControl("ABCD12").success);
    socket->simulateFrame(FrameType::CONTROL_GRANT, "");
    REQUIRE(listener->granted == vector<string>({"ABCD12"}));
    REQUIRE(manager->sendInput("ABCD12", "pwd\n").success);
    REQUIRE(manager->releaseControl("ABCD12").success);
    REQUIRE(errorCodeOf(manager->sendInput("ABCD12", "pwd\n")) ==
            code(ShareErrorCode::UNKNOWN));
    REQUIRE(manager->listJoinedShares()[0].role == READ_ONLY);
  }

  SECTION("Ended shares leave the registry") {
    REQUIRE(join("ABCD12").success);
    shared_ptr<FakeShareSocket> socket = sockets->last();
    socket->simulateOpen();
    socket->simulateFrame(FrameType::SHARE_CLOSE,
                          "{\"reason\":\"host-stopped\",\"message\":\"bye\"}");
    REQUIRE(listener->joinedStopped.size() == 1);
    REQUIRE(manager->listJoinedShares().empty());
    REQUIRE(join("ABCD12").success);
  }
}

TEST_CASE_METHOD(SharingManagerFixture, "Shutting down", "[SharingManager]") {
  createManager();
  REQUIRE(start("session-1").success);
  REQUIRE(join("ABCD12").success);

  manager->destroy();
  REQUIRE(manager->listActiveShares().empty());
  REQUIRE(manager->listJoinedShares().empty());
  REQUIRE(relay->deletedRooms == vector<string>({"room-1"}));
  REQUIRE(listener->stopped.empty());
  REQUIRE(listener->joinedStopped.empty());
  REQUIRE(scheduler->pendingCount() == 0);

  REQUIRE_FALSE(start("session-1").success);
  REQUIRE_FALSE(join("ABCD12").success);
  manager->destroy();
}

TEST_CASE_METHOD(SharingManagerFixture, "Settings", "[SharingManager]") {
  createManager();
  REQUIRE(manager->getSettings().displayName == "TermShare User");
  SharingSettingsUpdate update;
  update.displayName = string("Lin");
  update.autoExpireMs = 1000;
  SharingSettings updated = manager->updateSettings(update);
  REQUIRE(updated.displayName == "Lin");
  REQUIRE(manager->getSettings().autoExpireMs == optional<int64_t>(1000));
}
