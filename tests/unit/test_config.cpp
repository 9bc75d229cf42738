#include "edgelog/common/Config.h"
#include "edgelog/common/Logger.h"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace edgelog::common;

static void testParseSections() {
    auto& conf = Config::Instance();
    conf.Clear();
    bool ok = conf.LoadFromString(
        "log_level = DEBUG\n"
        "# comment\n"
        "; another comment\n"
        "[proxy]\n"
        "routes_file = /tmp/routes.json \n"
        "high_water_mark_kb=512\n"
        "\n"
        "[ api ]\n"
        "prefix = /_edge\n"
        "[dashboard]\n"
        "enabled = yes\n"
        "bogus line without equals\n");
    assert(ok);
    assert(conf.GetString("global", "log_level") == "DEBUG");
    assert(conf.GetString("proxy", "routes_file") == "/tmp/routes.json");
    assert(conf.GetInt("proxy", "high_water_mark_kb", 0) == 512);
    assert(conf.GetString("api", "prefix", "/_proxy") == "/_edge");
    assert(conf.GetBool("dashboard", "enabled", false));
    assert(conf.GetString("store", "db_file", "/data/connections.db") == "/data/connections.db");
    LOG_INFO << "Config sections PASS";
}

static void testTypedDefaults() {
    auto& conf = Config::Instance();
    conf.Clear();
    conf.LoadFromString("[global]\nlisten_port = eighty\nthreads =\nflag = maybe\n");
    assert(conf.GetInt("global", "listen_port", 8080) == 8080);
    assert(conf.GetInt("global", "threads", 4) == 4);
    assert(conf.GetBool("global", "flag", true));
    assert(!conf.GetBool("global", "flag", false));
    conf.SetString("global", "flag", "OFF");
    assert(!conf.GetBool("global", "flag", true));
    LOG_INFO << "Config typed defaults PASS";
}

static void testEnvOverride() {
    auto& conf = Config::Instance();
    conf.Clear();
    conf.LoadFromString("[global]\nlisten_port = 8080\ndata_dir = /data\n");

    ::setenv("EDGELOG_TEST_PORT", "9090", 1);
    ::setenv("EDGELOG_TEST_EMPTY", "", 1);
    ::unsetenv("EDGELOG_TEST_UNSET");

    assert(conf.ApplyEnvOverride("EDGELOG_TEST_PORT", "global", "listen_port"));
    assert(!conf.ApplyEnvOverride("EDGELOG_TEST_EMPTY", "global", "data_dir"));
    assert(!conf.ApplyEnvOverride("EDGELOG_TEST_UNSET", "global", "data_dir"));
    assert(conf.GetInt("global", "listen_port", 0) == 9090);
    assert(conf.GetString("global", "data_dir") == "/data");
    LOG_INFO << "Config env override PASS";
}

static void testLoadFile() {
    auto& conf = Config::Instance();
    conf.Clear();
    assert(!conf.Load("/nonexistent/edgelog.conf"));
    assert(!conf.LoadedFilename().has_value());

    char path[] = "/tmp/edgelog_conf_XXXXXX";
    int fd = ::mkstemp(path);
    assert(fd >= 0);
    {
        std::ofstream out(path);
        out << "[store]\nbusy_timeout_ms = 250\n";
    }
    assert(conf.Load(path));
    assert(conf.LoadedFilename().value() == path);
    assert(conf.GetInt("store", "busy_timeout_ms", 5000) == 250);
    std::remove(path);
    LOG_INFO << "Config file load PASS";
}

static void testPaths() {
    auto& conf = Config::Instance();
    conf.Clear();
    conf.LoadFromString("[store]\ndb_file = /var/lib/edge/c.db\nlog_file = logs/c.log\nempty =\n");
    assert(conf.GetPath("store", "db_file", "/srv", "connections.db") == "/var/lib/edge/c.db");
    assert(conf.GetPath("store", "log_file", "/srv", "connections.log") == "/srv/logs/c.log");
    assert(conf.GetPath("store", "empty", "/srv/", "connections.log") == "/srv/connections.log");
    assert(conf.GetPath("store", "missing", "/srv", "connections.db") == "/srv/connections.db");
    LOG_INFO << "Config paths PASS";
}

// The shipped file must follow DATA_DIR for every data file.
static void testShippedConfigFollowsDataDir() {
    auto& conf = Config::Instance();
    conf.Clear();
    assert(conf.Load(std::string(EDGELOG_SOURCE_DIR) + "/config/edgelog.conf"));
    ::setenv("DATA_DIR", "/tmp/edgelog_data", 1);
    ::unsetenv("PROXY_CONFIG");
    assert(conf.ApplyEnvOverride("DATA_DIR", "global", "data_dir"));
    assert(!conf.ApplyEnvOverride("PROXY_CONFIG", "proxy", "routes_file"));
    ::unsetenv("DATA_DIR");

    const std::string dataDir = conf.GetString("global", "data_dir", "/data");
    assert(dataDir == "/tmp/edgelog_data");
    assert(conf.GetPath("proxy", "routes_file", dataDir, "proxy-config.json") == "/tmp/edgelog_data/proxy-config.json");
    assert(conf.GetPath("store", "db_file", dataDir, "connections.db") == "/tmp/edgelog_data/connections.db");
    assert(conf.GetPath("store", "log_file", dataDir, "connections.log") == "/tmp/edgelog_data/connections.log");
    LOG_INFO << "Shipped config data dir PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseSections();
    testTypedDefaults();
    testEnvOverride();
    testLoadFile();
    testPaths();
    testShippedConfigFollowsDataDir();
    return 0;
}
