#pragma once
#include <string>
#include <utility>
#include <vector>

#include "inf/transport.hpp"

// In-memory Transport: records every request and replies with a canned
// response (or a canned failure).
class RecordingTransport : public inf::Transport {
public:
    struct Recorded {
        std::string method;
        std::string url;
        std::vector<std::pair<std::string, std::string>> headers;
        bool has_body = false;
        std::string body;

        std::string header(const std::string& name) const {
            for (const auto& kv : headers) {
                if (kv.first == name) return kv.second;
            }
            return {};
        }
        bool has_header(const std::string& name) const {
            for (const auto& kv : headers) {
                if (kv.first == name) return true;
            }
            return false;
        }
    };

    void reply(int status, std::string body, std::string status_text = "") {
        response = inf::HttpResponse{};
        response.status_code = status;
        response.status_text = std::move(status_text);
        response.headers["Content-Type"] = "application/json";
        response.body = std::move(body);
        fail = false;
    }

    void fail_with(const std::string& why) {
        fail = true;
        failure = inf::Error{inf::err_id::kTransport, why};
    }

    bool send(const inf::HttpRequest& req, inf::HttpResponse& out, inf::Error& err) override {
        Recorded r;
        r.method = req.method;
        r.url = req.url;
        r.headers = req.headers;
        r.has_body = req.body != nullptr;
        if (req.body) r.body = *req.body;
        requests.push_back(std::move(r));

        if (fail) {
            err = failure;
            return false;
        }
        out = response;
        return true;
    }

    std::vector<Recorded> requests;
    inf::HttpResponse response;
    bool fail = false;
    inf::Error failure;
};
