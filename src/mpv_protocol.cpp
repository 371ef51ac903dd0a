#include "mpv_protocol.hpp"
#include <nlohmann/json.hpp>

namespace qrplay {
namespace mpv {

std::string encode_command(const std::vector<std::string>& args, int64_t request_id) {
    nlohmann::json request = {
        {"command", args},
        {"request_id", request_id}
    };
    return request.dump() + "\n";
}

std::string encode_observe_property(const std::string& property, int64_t observer_id, int64_t request_id) {
    nlohmann::json request = {
        {"command", nlohmann::json::array({"observe_property", observer_id, property})},
        {"request_id", request_id}
    };
    return request.dump() + "\n";
}

Message parse_message(const std::string& line) {
    Message message;

    nlohmann::json json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return message;
    }

    if (json.contains("event") && json["event"].is_string()) {
        message.kind = Message::Kind::EVENT;
        message.event = json["event"].get<std::string>();
        if (json.contains("reason") && json["reason"].is_string()) {
            message.reason = json["reason"].get<std::string>();
        }
        if (json.contains("name") && json["name"].is_string()) {
            message.property = json["name"].get<std::string>();
        }
        if (json.contains("data") && json["data"].is_boolean()) {
            message.flag = json["data"].get<bool>();
        }
        return message;
    }

    if (json.contains("error") && json["error"].is_string()) {
        message.kind = Message::Kind::RESPONSE;
        message.error = json["error"].get<std::string>();
        if (json.contains("request_id") && json["request_id"].is_number_integer()) {
            message.request_id = json["request_id"].get<int64_t>();
        }
    }

    return message;
}

std::vector<std::string> build_launch_args(const std::string& binary,
                                           const std::string& socket_path,
                                           const std::string& media_path,
                                           bool fullscreen,
                                           bool start_paused,
                                           const std::vector<std::string>& extra_args) {
    std::vector<std::string> args = {
        binary,
        "--idle=yes",
        "--force-window=yes",
        fullscreen ? "--fullscreen=yes" : "--fullscreen=no",
        "--input-ipc-server=" + socket_path,
        "--image-display-duration=inf",
        "--no-input-default-bindings",
        "--no-osc",
        "--cursor-autohide=always",
        "--hwdec=auto",
        "--no-terminal",
        "--really-quiet",
    };
    if (start_paused) {
        args.push_back("--pause=yes");
    }
    args.insert(args.end(), extra_args.begin(), extra_args.end());

    // End of options so a media path starting with '-' is not taken as a flag
    args.push_back("--");
    args.push_back(media_path);
    return args;
}

}
}
