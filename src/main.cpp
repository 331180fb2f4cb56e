#include "core/ArgumentParser.h"
#include "core/CommandRunner.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/History.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/NameResolver.h"
#include "core/Privilege.h"
#include "core/Report.h"
#include "core/ScanEngine.h"
#include <fstream>
#include <iostream>

using namespace lan_scan;

static bool emit(const std::string& text, const Config& cfg){
    if(cfg.output_file.empty()){ std::cout << text; return static_cast<bool>(std::cout); }
    std::ofstream ofs(cfg.output_file);
    if(!ofs){ std::cerr << "Cannot open output file: " << cfg.output_file << "\n"; return false; }
    ofs << text;
    return static_cast<bool>(ofs);
}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    validator.apply_environment(cfg);
    if(!validator.validate(cfg)) return 2;
    if(!cfg.log_level.empty()){
        LogLevel lvl;
        if(parse_log_level(cfg.log_level, lvl)) Logger::instance().set_level(lvl);
    }
    set_config(cfg);

    JSONWriter writer;
    if(cfg.history_tail > 0){
        ScanHistory history(cfg.history_file);
        std::string out;
        for(const auto& e : history.tail(static_cast<size_t>(cfg.history_tail))) out += ScanHistory::to_json(e).dump() + "\n";
        return emit(out, cfg) ? 0 : 1;
    }

    if(cfg.drop_priv){
        if(is_privilege_available()) drop_capabilities();
        else Logger::instance().warn("--drop-priv ignored: built without libcap");
    }

    PosixCommandRunner runner;
    SystemNameResolver names;
    ScanEngine engine(runner, names, cfg);

    if(cfg.list_subnets){
        auto cidrs = engine.list_subnets();
        if(!emit(writer.write_subnets(cidrs, cfg), cfg)) return 1;
        return cidrs.empty() ? 3 : 0;
    }
    if(cfg.wifi_stations){
        return emit(writer.write_devices(engine.discover_wifi_stations(), cfg), cfg) ? 0 : 1;
    }

    ScanRequest req = make_scan_request(cfg);
    Report report;
    auto devices = engine.scan(req, report);
    if(!emit(writer.write(devices, report, cfg), cfg)) return 1;

    if(!cfg.history_file.empty() && report.subnet_resolved()){
        try {
            ScanHistory(cfg.history_file).append(req, devices);
        } catch(const HistoryError& ex) {
            Logger::instance().error(std::string("history: ") + ex.what());
            return 1;
        }
    }
    if(!report.subnet_resolved()){
        std::cerr << "No subnet could be determined; pass --subnet CIDR\n";
        return 3;
    }
    return 0;
}
