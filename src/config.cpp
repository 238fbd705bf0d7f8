#include "config.h"
#include "log.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <climits>

using namespace mpay;

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

static bool parse_bool(const std::string& v){
    return v=="1" || v=="true" || v=="yes" || v=="on";
}

static bool safe_parse_uint(const std::string& v, unsigned& out, const std::string& key) {
    try {
        size_t used = 0;
        unsigned long val = std::stoul(v, &used);
        if (used != v.size() || v[0] == '-') {
            log_error(LogCategory::CONFIG, "Invalid " + key + " value '" + v + "'");
            return false;
        }
        if (val > UINT_MAX) {
            log_error(LogCategory::CONFIG, key + " value '" + v + "' is too large");
            return false;
        }
        out = static_cast<unsigned>(val);
        return true;
    } catch (const std::exception& e) {
        log_error(LogCategory::CONFIG, "Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static bool safe_parse_u64(const std::string& v, uint64_t& out, const std::string& key) {
    try {
        size_t used = 0;
        unsigned long long val = std::stoull(v, &used);
        if (used != v.size() || v[0] == '-') {
            log_error(LogCategory::CONFIG, "Invalid " + key + " value '" + v + "'");
            return false;
        }
        out = static_cast<uint64_t>(val);
        return true;
    } catch (const std::exception& e) {
        log_error(LogCategory::CONFIG, "Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

bool mpay::load_config(const std::string& path, Config& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;

    std::string line;
    int line_num = 0;
    while(std::getline(f, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;
        if(line.rfind("//",0)==0) continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error(LogCategory::CONFIG, "line " + std::to_string(line_num) + ": missing '=' in '" + line + "'");
            continue;
        }
        std::string k = trim(line.substr(0,kpos));
        std::string v = trim(line.substr(kpos+1));
        std::transform(k.begin(), k.end(), k.begin(), ::tolower);

        if(k=="datadir") out.datadir = v;
        else if(k=="token_kind") out.token_kind = v;

        // Sponsorship
        else if(k=="sponsor_key") out.sponsor_key = v;
        else if(k=="sponsor_enabled") out.sponsor_enabled = parse_bool(v);

        // Client
        else if(k=="default_expiry_days") safe_parse_uint(v, out.default_expiry_days, k);
        else if(k=="max_nonce_probe") safe_parse_uint(v, out.max_nonce_probe, k);
        else if(k=="max_create_attempts") safe_parse_uint(v, out.max_create_attempts, k);
        else if(k=="max_resign_attempts") safe_parse_uint(v, out.max_resign_attempts, k);

        // Ledger
        else if(k=="checkpoint_window") safe_parse_uint(v, out.checkpoint_window, k);
        else if(k=="fee_per_signature") safe_parse_u64(v, out.fee_per_signature, k);

        else if(k=="notify_outbox") out.notify_outbox = v;
        else if(k=="log_level") out.log_level = v;
        else if(k=="log_file") out.log_file = v;
        else {
            log_warn(LogCategory::CONFIG, "line " + std::to_string(line_num) + ": unknown key '" + k + "' ignored");
        }
    }
    return true;
}
