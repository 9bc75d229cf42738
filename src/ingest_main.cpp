#include "edgelog/common/Config.h"
#include "edgelog/common/Logger.h"
#include "edgelog/ingest/LogIngester.h"
#include "edgelog/store/ConnectionRecorder.h"

#include <getopt.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    using namespace edgelog;

    std::string configFile;
    std::string dbPath;
    std::string logPath;
    std::string inputFile;
    bool verbose = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:d:l:f:vh")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'd':
                dbPath = optarg;
                break;
            case 'l':
                logPath = optarg;
                break;
            case 'f':
                inputFile = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-d db] [-l log] [-f input] [-v]\n", argv[0]);
                printf("  reads stdin when -f is not given\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_WARN << "Failed to load config " << configFile << ", using defaults.";
    }
    conf.ApplyEnvOverride("DATA_DIR", "global", "data_dir");
    common::Logger::Instance().SetLevel(common::Logger::Instance().ParseLevel(conf.GetString("global", "log_level", "INFO")));

    const std::string dataDir = conf.GetString("global", "data_dir", "/data");
    store::ConnectionRecorder::Options opts;
    opts.dbPath = dbPath.empty() ? conf.GetPath("store", "db_file", dataDir, "connections.db") : dbPath;
    opts.logPath = logPath.empty() ? conf.GetPath("store", "log_file", dataDir, "connections.log") : logPath;
    opts.busyTimeoutMs = conf.GetInt("store", "busy_timeout_ms", 5000);

    std::string err;
    std::unique_ptr<store::ConnectionRecorder> recorder = store::ConnectionRecorder::Open(opts, &err);
    if (!recorder) {
        LOG_ERROR << "Cannot open connection store: " << err;
        return 1;
    }

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!inputFile.empty()) {
        file.open(inputFile);
        if (!file) {
            LOG_ERROR << "Cannot open input " << inputFile;
            return 1;
        }
        in = &file;
        LOG_INFO << "Reading from file: " << inputFile;
    } else {
        LOG_INFO << "Reading from stdin";
    }
    LOG_INFO << "Ingesting into " << opts.dbPath << " and " << opts.logPath;

    ingest::LogIngester ingester(recorder.get(), verbose);
    const ingest::LogIngester::Summary& summary = ingester.Run(*in);
    if (in->bad()) {
        LOG_ERROR << "Error reading input";
        return 1;
    }

    LOG_INFO << "Processed " << summary.lines << " line(s)";
    for (int i = 0; i < ingest::LogIngester::kOutcomeCount; ++i) {
        const auto o = static_cast<ingest::LogIngester::Outcome>(i);
        LOG_INFO << "  " << ingest::LogIngester::OutcomeName(o) << ": " << summary.count(o);
    }
    return 0;
}
