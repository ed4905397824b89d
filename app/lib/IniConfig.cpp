#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool should_skip_line(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

bool parse_section_header(const std::string& line, std::string& section)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        section = Utils::trim_copy(line.substr(1, line.size() - 2));
        return true;
    }
    return false;
}

std::optional<std::pair<std::string, std::string>> parse_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim_copy(line.substr(0, delimiter));
    std::string value = Utils::trim_copy(line.substr(delimiter + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}
}


bool IniConfig::load(const std::string &filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        ini_log(spdlog::level::debug, "Config file not readable: {}", filename);
        return false;
    }

    data.clear();
    std::string raw_line;
    std::string section;
    while (std::getline(file, raw_line)) {
        const std::string line = Utils::trim_copy(raw_line);
        if (should_skip_line(line)) {
            continue;
        }
        if (parse_section_header(line, section)) {
            continue;
        }
        if (auto key_value = parse_key_value(line)) {
            data[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed line in {}: '{}'", filename, line);
        }
    }
    return true;
}


std::string IniConfig::getValue(const std::string &section, const std::string &key, const std::string &default_value) const {
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string &section, const std::string &key, const std::string &value) {
    data[section][key] = value;
}


bool IniConfig::getBool(const std::string& section, const std::string& key, bool default_value) const
{
    const std::string value = Utils::to_lower_copy(getValue(section, key, ""));
    if (value == "true" || value == "1" || value == "yes") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no") {
        return false;
    }
    return default_value;
}


void IniConfig::setBool(const std::string& section, const std::string& key, bool value)
{
    setValue(section, key, value ? "true" : "false");
}


int IniConfig::getInt(const std::string& section, const std::string& key, int default_value) const
{
    const std::string value = getValue(section, key, "");
    if (value.empty()) {
        return default_value;
    }
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            return default_value;
        }
        return parsed;
    } catch (const std::exception&) {
        ini_log(spdlog::level::warn, "[{}] {} is not a number: '{}'", section, key, value);
        return default_value;
    }
}


void IniConfig::setInt(const std::string& section, const std::string& key, int value)
{
    setValue(section, key, std::to_string(value));
}


std::vector<std::string> IniConfig::getList(const std::string& section, const std::string& key) const
{
    std::vector<std::string> result;
    std::stringstream ss(getValue(section, key, ""));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Utils::trim_copy(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}


void IniConfig::setList(const std::string& section, const std::string& key,
                        const std::vector<std::string>& values)
{
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << values[i];
    }
    setValue(section, key, oss.str());
}


void IniConfig::removeSection(const std::string& section)
{
    data.erase(section);
}


void IniConfig::clear()
{
    data.clear();
}


bool IniConfig::save(const std::string &filename) const
{
    // Write next to the target and rename so a crash never leaves half a file
    const std::string temp_name = filename + ".tmp";
    {
        std::ofstream file(temp_name, std::ios::trunc);
        if (!file.is_open()) {
            ini_log(spdlog::level::err, "Failed to open config file: {}", temp_name);
            return false;
        }

        for (const auto &section : data) {
            file << "[" << section.first << "]\n";
            for (const auto &pair : section.second) {
                file << pair.first << " = " << pair.second << "\n";
            }
            file << "\n";
        }
        if (!file.good()) {
            ini_log(spdlog::level::err, "Failed to write config file: {}", temp_name);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_name, filename, ec);
    if (ec) {
        ini_log(spdlog::level::err, "Failed to replace config file {}: {}", filename, ec.message());
        std::filesystem::remove(temp_name, ec);
        return false;
    }
    return true;
}

bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    const auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return false;
    }
    const auto key_it = sec_it->second.find(key);
    return key_it != sec_it->second.end();
}
