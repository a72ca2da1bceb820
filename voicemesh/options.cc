/*
 *  (c) 2025, wilddolphin2022
 *  For WebRTCsays.ai project
 *  https://github.com/wilddolphin2022
 *
 *  Use of this source code is governed by a BSD-style license
 *  that can be found in the LICENSE file in the root of the source
 *  tree. An additional intellectual property rights grant can be found
 *  in the file PATENTS.  All contributing project authors may
 *  be found in the AUTHORS file in the root of the source tree.
 */

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include "rtc_base/crypto_random.h"
#include "rtc_base/logging.h"

#include <json/json.h>
#include <algorithm>
#include <memory>
#include <sstream>
#include <unordered_set>

#include "options.h"

// String split
std::vector<std::string> stringSplit(std::string input, std::string delimiter);

namespace {

// 'x' and "x" both read as x.
std::string stripQuotes(const std::string& s) {
    if (s.size() >= 2) {
        if ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// strtol based, no exceptions. False when the whole string is not a number.
bool parseInt(const std::string& text, int& out) {
    const char* start_ptr = text.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    long value = strtol(start_ptr, &end_ptr, 10);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool parseFloat(const std::string& text, float& out) {
    const char* start_ptr = text.c_str();
    char* end_ptr = nullptr;
    errno = 0;
    float value = strtof(start_ptr, &end_ptr);
    if (errno != 0 || end_ptr == start_ptr || *end_ptr != '\0') {
        return false;
    }
    out = value;
    return true;
}

struct IntOption {
    const char* name;
    int Options::*field;
};

// Integer options shared by the config file and the command line.
const IntOption kIntOptions[] = {
    {"health_check_interval_ms", &Options::health_check_interval_ms},
    {"heartbeat_interval_ms", &Options::heartbeat_interval_ms},
    {"reconnect_delay_ms", &Options::reconnect_delay_ms},
    {"max_reconnect_attempts", &Options::max_reconnect_attempts},
    {"grace_period_ms", &Options::grace_period_ms},
    {"level_sample_interval_ms", &Options::level_sample_interval_ms},
    {"mute_poll_interval_ms", &Options::mute_poll_interval_ms},
    {"missing_connection_interval_ms", &Options::missing_connection_interval_ms},
    {"max_mesh_connections", &Options::max_mesh_connections},
};

bool loadConfigFile(const std::string& path, Options& opts) {
    FILE* fp = fopen(path.c_str(), "rb");
    if (!fp) {
        RTC_LOG(LS_WARNING) << "Could not open config file with fopen: " << path;
        return false;
    }
    std::string contents;
    fseek(fp, 0, SEEK_END);
    long size = ftell(fp);
    if (size < 0) {
        fclose(fp);
        RTC_LOG(LS_WARNING) << "Could not size config file: " << path;
        return false;
    }
    contents.resize(static_cast<size_t>(size));
    rewind(fp);
    size_t bytes_read = fread(&contents[0], 1, contents.size(), fp);
    fclose(fp);
    if (bytes_read != contents.size()) {
        RTC_LOG(LS_WARNING) << "Short read on config file " << path << ": "
                            << bytes_read << "/" << contents.size();
        return false;
    }

    Json::Value config_json;
    Json::CharReaderBuilder reader_builder;
    std::string errs;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    if (!reader->parse(contents.data(), contents.data() + contents.size(),
                       &config_json, &errs)) {
        RTC_LOG(LS_ERROR) << "Failed to parse config file " << path << ": " << errs;
        return false;
    }
    if (!config_json.isObject()) {
        RTC_LOG(LS_ERROR) << "Config file " << path << " is not a JSON object";
        return false;
    }

    // Strings
    if (config_json.isMember("server") && config_json["server"].isString()) {
        RTC_LOG(LS_INFO) << "Config server: " << config_json["server"].asString();
        opts.address = config_json["server"].asString();
    }
    if (config_json.isMember("ws_path") && config_json["ws_path"].isString()) {
        opts.ws_path = config_json["ws_path"].asString();
    }
    if (config_json.isMember("room_id") && config_json["room_id"].isString()) {
        RTC_LOG(LS_INFO) << "Config room_id: " << config_json["room_id"].asString();
        opts.room_id = config_json["room_id"].asString();
    }
    if (config_json.isMember("user_id") && config_json["user_id"].isString()) {
        RTC_LOG(LS_INFO) << "Config user_id: " << config_json["user_id"].asString();
        opts.user_id = config_json["user_id"].asString();
    }
    if (config_json.isMember("user_name") && config_json["user_name"].isString()) {
        RTC_LOG(LS_INFO) << "Config user_name: " << config_json["user_name"].asString();
        opts.user_name = config_json["user_name"].asString();
    }
    if (config_json.isMember("stun") && config_json["stun"].isString()) {
        opts.stun = config_json["stun"].asString();
    }
    if (config_json.isMember("turns")) {
        const Json::Value& t = config_json["turns"];
        if (t.isString()) {
            RTC_LOG(LS_INFO) << "Config has turns params (string)";
            opts.turns = t.asString();
        } else if (t.isArray() && t.size() >= 3 && t[0].isString() &&
                   t[1].isString() && t[2].isString()) {
            // [ uri, username, password ]
            opts.turns = t[0].asString() + "," + t[1].asString() + "," + t[2].asString();
            RTC_LOG(LS_INFO) << "Config turns array joined";
        } else {
            RTC_LOG(LS_WARNING) << "`turns` has unexpected structure, expecting a string "
                                   "or [uri, username, password]. Ignored.";
        }
    }
    if (config_json.isMember("log_level") && config_json["log_level"].isString()) {
        if (!ParseLoggingSeverity(config_json["log_level"].asString(), opts.log_level)) {
            RTC_LOG(LS_WARNING) << "Unknown log_level: " << config_json["log_level"].asString();
        }
    }

    // Booleans
    if (config_json.isMember("ssl") && config_json["ssl"].isBool()) {
        RTC_LOG(LS_INFO) << "Config ssl: " << config_json["ssl"].asBool();
        opts.ssl = config_json["ssl"].asBool();
    }
    if (config_json.isMember("can_transmit") && config_json["can_transmit"].isBool()) {
        RTC_LOG(LS_INFO) << "Config can_transmit: " << config_json["can_transmit"].asBool();
        opts.can_transmit = config_json["can_transmit"].asBool();
    }

    // Numbers
    for (const auto& option : kIntOptions) {
        if (config_json.isMember(option.name) && config_json[option.name].isInt()) {
            opts.*option.field = config_json[option.name].asInt();
            RTC_LOG(LS_INFO) << "Config " << option.name << ": " << opts.*option.field;
        }
    }
    if (config_json.isMember("silence_threshold") && config_json["silence_threshold"].isNumeric()) {
        opts.silence_threshold = config_json["silence_threshold"].asFloat();
        RTC_LOG(LS_INFO) << "Config silence_threshold: " << opts.silence_threshold;
    }

    RTC_LOG(LS_INFO) << "Loaded options from config file: " << path;
    return true;
}

} // namespace

// host:port, port in 0..65535.
bool VOICEMESH_API ParseIpAndPort(const std::string& ip_port, std::string& ip, int& port) {
  size_t colon_pos = ip_port.rfind(':');
  if (colon_pos == std::string::npos) {
    RTC_LOG(LS_ERROR) << "Invalid IP:PORT format: " << ip_port;
    return false;
  }

  ip = ip_port.substr(0, colon_pos);
  std::string port_str = ip_port.substr(colon_pos + 1);

  int port_val = 0;
  if (!parseInt(port_str, port_val)) {
    RTC_LOG(LS_ERROR) << "Invalid port string: " << port_str;
    return false;
  }

  if (port_val < 0 || port_val > 65535) {
    RTC_LOG(LS_ERROR) << "Invalid port range: " << port_val;
    return false;
  }

  port = port_val;
  return true;
}

// Basic split that honours quotes, only used for cmd-line string variant.
std::vector<std::string> stringSplit(std::string input, std::string delimiter)
{
    if (delimiter != " ") {
        std::vector<std::string> tokens;
        size_t pos = 0;
        while((pos = input.find(delimiter)) != std::string::npos){
            tokens.push_back(input.substr(0, pos));
            input.erase(0, pos + delimiter.size());
        }
        tokens.push_back(input);
        return tokens;
    }

    std::vector<std::string> tokens;
    std::string current;
    bool in_quotes = false;
    for (char c : input) {
        if (c == '"') {
            in_quotes = !in_quotes;
            continue; // drop the quote char itself
        }
        if (c == ' ' && !in_quotes) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

VOICEMESH_API Options parseOptions(const char* argString) {
  std::vector<std::string> args = stringSplit(argString, " ");
  return parseOptions(args);
}

Options parseOptions(const std::vector<std::string>& args) {
  Options opts;
  opts.help_string =
      "Usage:\n"
      "voicemesh_client [options] host:port [options]\n\n"
      "Options:\n"
      "  --config <path>                  Load options from JSON config file.\n"
      "                                     Command-line options override config file.\n"
      "  --ssl, --no-ssl                    Use TLS towards the signaling relay (default: no-ssl)\n"
      "  --ws_path=<path>                   WebSocket path on the relay (default: '/')\n"
      "  --room_id=<id>                     Voice room to join (default: room101)\n"
      "  --user_id=<id>                     Stable user id (default: random uuid)\n"
      "  --user_name=<name>                 Display name (default: user id)\n"
      "  --can_transmit, --no-can_transmit  Send the microphone or listen only (default: send)\n"
      "  --stun=<uri>                       STUN server (default: stun:stun.l.google.com:19302)\n"
      "  --turns=<uri,username,password>    TURN server, e.g. \n"
      "   'turn:turn.example.org:3478?transport=udp,<username>,<password>'\n"
      "  --health_check_interval_ms=<ms>    Connection watchdog period (default: 15000)\n"
      "  --heartbeat_interval_ms=<ms>       Heartbeat period (default: 30000)\n"
      "  --reconnect_delay_ms=<ms>          Delay before a peer reconnect (default: 2000)\n"
      "  --max_reconnect_attempts=<n>       Reconnects per peer before giving up (default: 3)\n"
      "  --grace_period_ms=<ms>             Relay outage tolerance (default: 60000)\n"
      "  --level_sample_interval_ms=<ms>    Audio level sampling period (default: 200)\n"
      "  --mute_poll_interval_ms=<ms>       Local mute polling period (default: 200)\n"
      "  --missing_connection_interval_ms=<ms>\n"
      "                                     Sweep for roster peers without a link (default: 2000)\n"
      "  --silence_threshold=<level>        Silence level treated as muted (default: 0.02)\n"
      "  --max_mesh_connections=<n>         Peer connection limit (default: 9)\n"
      "  --log_level=<verbose|info|warning|error|none>\n"
      "  --help                             Show this help message\n\n"
      "Examples:\n"
      "  voicemesh_client --config voice.json\n"
      "  voicemesh_client --user_name=alice --room_id=jam1 relay.example.com:443 --ssl\n"
      "  voicemesh_client --user_name=bob --room_id=jam1 192.168.88.225:3456 --no-can_transmit\n"
      ;

  // Flags that can never be the relay address.
  const std::unordered_set<std::string> known_options = {
    "--config", "--ssl", "--no-ssl", "--ws_path", "--room_id", "--user_id",
    "--user_name", "--can_transmit", "--no-can_transmit", "--stun", "--turns",
    "--health_check_interval_ms", "--heartbeat_interval_ms", "--reconnect_delay_ms",
    "--max_reconnect_attempts", "--grace_period_ms", "--level_sample_interval_ms",
    "--mute_poll_interval_ms", "--missing_connection_interval_ms", "--silence_threshold", "--max_mesh_connections",
    "--log_level", "--help"
  };

  // Config file first, the command line overrides it.
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--config" && i + 1 < args.size()) {
      opts.config_path = args[i + 1];
      break;
    } else if (arg.find("--config=") == 0) {
      opts.config_path = arg.substr(9);
      break;
    } else if (arg == "--help") {
      opts.help = true;
      return opts;
    }
  }

  if (!opts.config_path.empty()) {
    loadConfigFile(opts.config_path, opts);
  }

  auto isAddress = [](const std::string& str) {
    size_t colon_pos = str.rfind(':');
    return colon_pos != std::string::npos && colon_pos > 0 && colon_pos < str.length() - 1;
  };

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--config" && i + 1 < args.size()) {
      i++;
      continue;
    } else if (arg.find("--config=") == 0) {
      continue;
    }

    size_t eq = arg.find('=');
    std::string name = arg.substr(0, eq);
    std::string value = eq != std::string::npos ? stripQuotes(arg.substr(eq + 1)) : "";

    bool handled = true;
    if (eq != std::string::npos && name == "--ws_path") {
      opts.ws_path = value;
    } else if (eq != std::string::npos && name == "--room_id") {
      opts.room_id = value;
    } else if (eq != std::string::npos && name == "--user_id") {
      opts.user_id = value;
    } else if (eq != std::string::npos && name == "--user_name") {
      opts.user_name = value;
    } else if (eq != std::string::npos && name == "--stun") {
      opts.stun = value;
    } else if (eq != std::string::npos && name == "--turns") {
      opts.turns = value;
      opts.turns.erase(std::remove(opts.turns.begin(), opts.turns.end(), '\''), opts.turns.end());
    } else if (eq != std::string::npos && name == "--log_level") {
      if (!ParseLoggingSeverity(value, opts.log_level)) {
        RTC_LOG(LS_WARNING) << "Unknown log level: " << value;
      }
    } else if (eq != std::string::npos && name == "--silence_threshold") {
      if (!parseFloat(value, opts.silence_threshold)) {
        RTC_LOG(LS_WARNING) << "Invalid silence threshold: " << value;
      }
    } else if (arg == "--ssl") {
      RTC_LOG(LS_INFO) << "Args set ssl on";
      opts.ssl = true;
    } else if (arg == "--no-ssl") {
      RTC_LOG(LS_INFO) << "Args set ssl off";
      opts.ssl = false;
    } else if (arg == "--can_transmit") {
      RTC_LOG(LS_INFO) << "Args set can_transmit on";
      opts.can_transmit = true;
    } else if (arg == "--no-can_transmit") {
      RTC_LOG(LS_INFO) << "Args set can_transmit off";
      opts.can_transmit = false;
    } else {
      handled = false;
    }

    if (!handled && eq != std::string::npos) {
      for (const auto& option : kIntOptions) {
        if (name == std::string("--") + option.name) {
          if (!parseInt(value, opts.*option.field)) {
            RTC_LOG(LS_WARNING) << "Invalid value for " << name << ": " << value;
          }
          handled = true;
          break;
        }
      }
    }
    if (handled) {
      continue;
    }

    // Positional relay address.
    if (arg.rfind("--", 0) != 0 && isAddress(arg)) {
       opts.address = arg;
    } else if (arg.rfind("--", 0) == 0) {
        if (known_options.find(name) == known_options.end()) {
            RTC_LOG(LS_WARNING) << "Unknown option: " << arg;
        }
    }
  }

  // Environment is the lowest priority
  if (opts.user_id.empty()) {
    if (const char* env_user = std::getenv("VOICEMESH_USER_ID")) {
      opts.user_id = env_user;
    }
  }
  if (opts.user_id.empty()) {
    opts.user_id = VoiceMeshCreateRandomUuid();
    RTC_LOG(LS_INFO) << "Auto-generated user_id: " << opts.user_id;
  }
  if (opts.user_name.empty()) {
    opts.user_name = opts.user_id;
  }
  if (opts.room_id.empty()) {
    opts.room_id = MeshDefaults::kDefaultRoom;
  }

  return opts;
}

std::string getUsage(const Options opts) {
  std::stringstream usage;

  usage << "\n--- Current Settings ---\n";
  usage << "Relay: " << (!opts.address.empty() ? opts.address : "(not set)")
        << (opts.ssl ? " (tls)" : "") << "\n";
  usage << "Room: " << opts.room_id << "\n";
  usage << "User: " << opts.user_name << " (" << opts.user_id << ")\n";
  usage << "Transmit: " << (opts.can_transmit ? "enabled" : "listen only") << "\n";
  usage << "STUN Server: " << (!opts.stun.empty() ? opts.stun : "(not set)") << "\n";
  usage << "TURN Server: " << (!opts.turns.empty() ? opts.turns : "(not set)") << "\n";
  usage << "Health check: " << opts.health_check_interval_ms << "ms, heartbeat: "
        << opts.heartbeat_interval_ms << "ms, grace: " << opts.grace_period_ms << "ms\n";
  usage << "Reconnect: " << opts.max_reconnect_attempts << " attempts, "
        << opts.reconnect_delay_ms << "ms apart\n";
  if (!opts.config_path.empty()) {
      usage << "Config File Used: " << opts.config_path << "\n";
  }
  usage << "------------------------\n";

  return usage.str();
}

VoiceMeshConfig MeshConfigFromOptions(const Options& opts) {
  VoiceMeshConfig config;
  config.room_id = opts.room_id;
  config.user_id = opts.user_id;
  config.username = opts.user_name;
  config.can_transmit = opts.can_transmit;
  config.health_check_interval = webrtc::TimeDelta::Millis(opts.health_check_interval_ms);
  config.heartbeat_interval = webrtc::TimeDelta::Millis(opts.heartbeat_interval_ms);
  config.reconnect_delay = webrtc::TimeDelta::Millis(opts.reconnect_delay_ms);
  config.max_reconnect_attempts = std::max(0, opts.max_reconnect_attempts);
  config.grace_period = webrtc::TimeDelta::Millis(opts.grace_period_ms);
  config.level_sample_interval = webrtc::TimeDelta::Millis(opts.level_sample_interval_ms);
  config.mute_poll_interval = webrtc::TimeDelta::Millis(opts.mute_poll_interval_ms);
  config.missing_connection_interval =
      webrtc::TimeDelta::Millis(opts.missing_connection_interval_ms);
  config.silence_threshold = opts.silence_threshold;
  config.max_mesh_connections = opts.max_mesh_connections;
  return config;
}

// LOGGING

bool ParseLoggingSeverity(const std::string& name, LoggingSeverity& out) {
  if (name == "verbose") {
    out = LS_VERBOSE;
  } else if (name == "info") {
    out = LS_INFO;
  } else if (name == "warning") {
    out = LS_WARNING;
  } else if (name == "error") {
    out = LS_ERROR;
  } else if (name == "none") {
    out = LS_NONE;
  } else {
    return false;
  }
  return true;
}

void VoiceMeshSetLoggingLevel(LoggingSeverity level) {
  rtc::LogMessage::LogToDebug(static_cast<rtc::LoggingSeverity>(level));
  rtc::LogMessage::LogTimestamps();
  rtc::LogMessage::LogThreads();
}

VOICEMESH_API std::string VoiceMeshCreateRandomUuid() {
  return rtc::CreateRandomUuid();
}

VOICEMESH_API void VoiceMeshThreadSetName(rtc::Thread* thread, const char* name) {
  if(thread && name && *name) {
    thread->SetName(name, nullptr);
  }
}
