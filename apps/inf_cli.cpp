// SPDX-License-Identifier: Apache-2.0
// Part of the Infinity client (INF) project.
// apps/inf_cli.cpp

#include "inf/client.hpp"
#include "inf/log.hpp"
#include "inf/responses.hpp"
#include "inf/internal/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " [-k KEY] [-url URL] -q HASH[,HASH...] [-json] [-v]\n"
      "  " << argv0 << " [-k KEY] [-url URL] -f FILE -c CODE [-json] [-v]\n"
      "\n"
      "  -k     API key; defaults to $INFINITY_KEY\n"
      "  -url   Infinity API URL (default " << inf::kDefaultUrl << ")\n"
      "  -q     hash or comma separated list of hashes to query\n"
      "  -f     file to upload for processing\n"
      "  -c     confirmation code for the upload\n"
      "  -json  print replies as JSON instead of formatted text\n"
      "  -v     trace requests and responses to stderr\n";
}

static void check(bool ok, const inf::Error& err){
    if (!ok) {
        std::cerr << "Error - " << err.to_string() << "\n";
        std::exit(2);
    }
}

// "-name" and "--name" are equivalent.
static std::string flag_name(const std::string& a){
    if (a.size() > 2 && a[0] == '-' && a[1] == '-') return a.substr(2);
    if (a.size() > 1 && a[0] == '-') return a.substr(1);
    return {};
}

static std::string classifiers_text(const std::map<std::string, float>& m){
    std::ostringstream oss;
    oss << "map[";
    bool first = true;
    for (const auto& kv : m) {
        if (!first) oss << ' ';
        first = false;
        oss << kv.first << ':' << kv.second;
    }
    oss << ']';
    return oss.str();
}

int main(int argc, char** argv){
    const char* env_key = std::getenv("INFINITY_KEY");
    std::string key = env_key ? env_key : "";
    std::string url = inf::kDefaultUrl;
    std::string q, f, c;
    bool json_format = false;
    bool verbose = false;

    for(int i=1;i<argc;++i){
        const std::string a = flag_name(argv[i]);
        if(a=="k" && i+1<argc) key = argv[++i];
        else if(a=="url" && i+1<argc) url = argv[++i];
        else if(a=="q" && i+1<argc) q = argv[++i];
        else if(a=="f" && i+1<argc) f = argv[++i];
        else if(a=="c" && i+1<argc) c = argv[++i];
        else if(a=="json") json_format = true;
        else if(a=="v") verbose = true;
        else { usage(argv[0]); return 1; }
    }

    if (q.empty() && f.empty()) {
        std::cerr << "No command given. Please specify either q or f as parameters\n";
        return 1;
    }
    if (f.empty() != c.empty()) {
        std::cerr << "You must provide both the file and confirmation code for upload\n";
        return 1;
    }

    auto stderr_sink = std::make_shared<inf::StreamLogSink>(std::cerr);
    std::vector<inf::Option> options{
        inf::set_error_log(stderr_sink),
        inf::set_url(url),
        inf::set_key(key),
    };
    if (verbose) options.push_back(inf::set_trace_log(stderr_sink));

    inf::Error err;
    std::unique_ptr<inf::Client> cli = inf::Client::create(options, err);
    check(cli != nullptr, err);

    if (!q.empty()) {
        const std::vector<std::string> hashes = inf::internal::split(q, ',');
        inf::QueryResult res;
        check(cli->query("", hashes, res, err), err);
        if (json_format) {
            std::cout << nlohmann::json(res).dump(1, '\t') << "\n";
        } else {
            for (const auto& kv : res) {
                const inf::QueryResponse& v = kv.second;
                std::ostringstream score;
                if (v.general_score != 0) score << v.general_score; else score << "-";
                const std::string conf = v.confirm_code.empty() ? "-" : v.confirm_code;
                std::cout << kv.first << "\t" << v.status << " [" << v.status_code << "] " << v.error
                          << "\t" << score.str() << "\t" << conf << "\t" << classifiers_text(v.classifiers) << "\n";
            }
        }
    }

    if (!f.empty()) {
        inf::UploadResult res;
        check(cli->upload_file(c, f, res, err), err);
        if (json_format) {
            std::cout << nlohmann::json(res).dump(1, '\t') << "\n";
        } else {
            for (const auto& kv : res) {
                const inf::UploadResponse& v = kv.second;
                std::cout << "Upload done with result: " << v.status << " [" << v.status_code << "] " << v.error << "\n";
            }
        }
    }
    return 0;
}
