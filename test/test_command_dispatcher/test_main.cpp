#include <unity.h>
#include <string.h>

#include "Modules/Network/MQTTModule/CommandDispatcher.h"
#include "Modules/WakeModule/WakeSchedule.h"

void setUp() {}
void tearDown() {}

struct FakeWake {
    int wakeCalls = 0;
    bool wakeOk = true;
    bool probeRuns = true;
    bool online = false;
    WakeSchedule schedule;
};

static bool fakeSend(void* ctx)
{
    FakeWake* f = static_cast<FakeWake*>(ctx);
    f->wakeCalls++;
    return f->wakeOk;
}

static bool fakeProbe(void* ctx, bool* online)
{
    FakeWake* f = static_cast<FakeWake*>(ctx);
    if (!f->probeRuns) return false;
    *online = f->online;
    return true;
}

static bool fakeUsage(void*, WakeUsage* out)
{
    out->uptimeS = 3600;
    out->heapFree = 150000;
    out->heapTotal = 320000;
    out->flashUsed = 1000000;
    out->flashTotal = 4194304;
    out->cpuMhz = 240;
    out->cores = 2;
    out->rssi = -61;
    return true;
}

static bool fakeScheduleJson(void* ctx, char* out, size_t outLen)
{
    return static_cast<FakeWake*>(ctx)->schedule.toJson(out, outLen);
}

static bool fakeSetSchedule(void* ctx, const char* json, ErrorCode* err, uint8_t* badSlot, uint8_t* saved)
{
    return static_cast<FakeWake*>(ctx)->schedule.applyJson(json, *err, *badSlot, *saved);
}

static WakeService makeService(FakeWake& f)
{
    WakeService svc{};
    svc.sendMagicPacket = fakeSend;
    svc.probeTarget = fakeProbe;
    svc.collectUsage = fakeUsage;
    svc.scheduleJson = fakeScheduleJson;
    svc.setSchedule = fakeSetSchedule;
    svc.ctx = &f;
    return svc;
}

static Command request(CommandKind kind)
{
    Command c;
    c.kind = kind;
    c.setTarget("DEV01");
    c.issuedAt = 1000;
    return c;
}

void test_wake_is_fire_and_forget()
{
    FakeWake f;
    const WakeService svc = makeService(f);
    CommandDispatcher d;
    d.bind(&svc, "DEV01");

    Command resp;
    const DispatchResult r = d.handle(request(CommandKind::Wake), 2000, resp);
    TEST_ASSERT_FALSE(r.hasResponse);
    TEST_ASSERT_TRUE(r.actionOk);
    TEST_ASSERT_EQUAL_INT(1, f.wakeCalls);

    f.wakeOk = false;
    const DispatchResult r2 = d.handle(request(CommandKind::Wake), 2000, resp);
    TEST_ASSERT_FALSE(r2.hasResponse);
    TEST_ASSERT_FALSE(r2.actionOk);
}

void test_status_reports_probe_result()
{
    FakeWake f;
    f.online = true;
    const WakeService svc = makeService(f);
    CommandDispatcher d;
    d.bind(&svc, "DEV01");

    Command resp;
    DispatchResult r = d.handle(request(CommandKind::Status), 2000, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_EQUAL(CommandKind::Status, resp.kind);
    TEST_ASSERT_EQUAL_STRING("DEV01", resp.target);
    TEST_ASSERT_EQUAL_UINT64(2000, resp.issuedAt);
    TEST_ASSERT_EQUAL_STRING("{\"online\":true,\"status\":\"ONLINE\"}", resp.args);

    f.online = false;
    r = d.handle(request(CommandKind::Status), 2000, resp);
    TEST_ASSERT_EQUAL_STRING("{\"online\":false,\"status\":\"OFFLINE\"}", resp.args);

    f.probeRuns = false;
    r = d.handle(request(CommandKind::Status), 2000, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_FALSE(r.actionOk);
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"IoError\""));
}

void test_usage_packages_collector_values()
{
    FakeWake f;
    const WakeService svc = makeService(f);
    CommandDispatcher d;
    d.bind(&svc, "DEV01");

    Command resp;
    const DispatchResult r = d.handle(request(CommandKind::Usage), 2000, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"uptime_s\":3600"));
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"cpu_mhz\":240"));
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"cores\":2"));
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"rssi\":-61"));
}

void test_ping_answers_pong()
{
    CommandDispatcher d;
    d.bind(nullptr, "DEV01");
    Command resp;
    const DispatchResult r = d.handle(request(CommandKind::Ping), 5, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_EQUAL_STRING("{\"pong\":true}", resp.args);
}

void test_missing_collaborator_is_reported_not_crashed()
{
    CommandDispatcher d;
    d.bind(nullptr, "DEV01");
    Command resp;
    DispatchResult r = d.handle(request(CommandKind::Wake), 5, resp);
    TEST_ASSERT_FALSE(r.actionOk);
    r = d.handle(request(CommandKind::Usage), 5, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"NotReady\""));
}

void test_set_then_get_schedule()
{
    FakeWake f;
    const WakeService svc = makeService(f);
    CommandDispatcher d;
    d.bind(&svc, "DEV01");

    Command set = request(CommandKind::SetSchedule);
    TEST_ASSERT_TRUE(set.setArgs("{\"slots\":[{\"slot\":2,\"enabled\":true,\"days\":31,\"hour\":6,\"minute\":45}]}"));
    Command resp;
    DispatchResult r = d.handle(set, 10, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_TRUE(r.actionOk);
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"saved\":1}", resp.args);

    r = d.handle(request(CommandKind::GetSchedule), 11, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_EQUAL_STRING("{\"slots\":[{\"slot\":2,\"enabled\":true,\"days\":31,\"hour\":6,\"minute\":45}]}",
                             resp.args);
}

void test_set_schedule_errors_name_the_entry()
{
    FakeWake f;
    const WakeService svc = makeService(f);
    CommandDispatcher d;
    d.bind(&svc, "DEV01");

    Command resp;
    DispatchResult r = d.handle(request(CommandKind::SetSchedule), 10, resp);
    TEST_ASSERT_FALSE(r.actionOk);
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"MissingArgs\""));

    Command set = request(CommandKind::SetSchedule);
    TEST_ASSERT_TRUE(set.setArgs("{\"slots\":[{\"slot\":0,\"enabled\":true,\"days\":1,\"hour\":6,\"minute\":0},"
                                 "{\"slot\":1,\"enabled\":true,\"days\":1,\"hour\":24,\"minute\":0}]}"));
    r = d.handle(set, 10, resp);
    TEST_ASSERT_TRUE(r.hasResponse);
    TEST_ASSERT_FALSE(r.actionOk);
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"slot\":1"));
    TEST_ASSERT_NOT_NULL(strstr(resp.args, "\"InvalidHour\""));
    TEST_ASSERT_EQUAL_UINT8(0, f.schedule.usedCount());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_wake_is_fire_and_forget);
    RUN_TEST(test_status_reports_probe_result);
    RUN_TEST(test_usage_packages_collector_values);
    RUN_TEST(test_ping_answers_pong);
    RUN_TEST(test_missing_collaborator_is_reported_not_crashed);
    RUN_TEST(test_set_then_get_schedule);
    RUN_TEST(test_set_schedule_errors_name_the_entry);
    return UNITY_END();
}
