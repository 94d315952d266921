#include "ConVar.hpp"
#include "Utils/Log.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

namespace Tether {

namespace {

bool parseInt(const std::string& text, int& out)
{
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX) {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

bool parseFloat(const std::string& text, float& out)
{
    if (text.empty()) {
        return false;
    }

    char* end = nullptr;
    errno = 0;
    float parsed = std::strtof(text.c_str(), &end);
    if (errno != 0 || *end != '\0') {
        return false;
    }
    out = parsed;
    return true;
}

bool parseBool(const std::string& text, bool& out)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string trim(const std::string& text)
{
    size_t first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

} // namespace

// =============================================================================
// ConVar
// =============================================================================

ConVar::ConVar(const char* cvar_name, Value default_val, uint32_t cvar_flags, const char* cvar_description)
    : name(cvar_name)
    , description(cvar_description)
    , flags(cvar_flags)
    , value(default_val)
    , default_value(std::move(default_val))
{
    ConVarRegistry::get().add(this);
}

ConVar::ConVar(const char* name, int default_value, uint32_t flags, const char* description)
    : ConVar(name, Value(default_value), flags, description)
{
}

ConVar::ConVar(const char* name, float default_value, uint32_t flags, const char* description)
    : ConVar(name, Value(default_value), flags, description)
{
}

ConVar::ConVar(const char* name, bool default_value, uint32_t flags, const char* description)
    : ConVar(name, Value(default_value), flags, description)
{
}

ConVar::ConVar(const char* name, const char* default_value, uint32_t flags, const char* description)
    : ConVar(name, Value(std::string(default_value)), flags, description)
{
}

ConVar::ConVar(const char* name, int default_value, int min_value, int max_value, uint32_t flags,
               const char* description)
    : ConVar(name, Value(default_value), flags, description)
{
    bounded = true;
    this->min_value = min_value;
    this->max_value = max_value;
}

ConVar::ConVar(const char* name, float default_value, float min_value, float max_value, uint32_t flags,
               const char* description)
    : ConVar(name, Value(default_value), flags, description)
{
    bounded = true;
    this->min_value = min_value;
    this->max_value = max_value;
}

ConVar::~ConVar()
{
    ConVarRegistry::get().remove(this);
}

int ConVar::getInt() const
{
    if (const int* v = std::get_if<int>(&value)) return *v;
    if (const float* v = std::get_if<float>(&value)) return static_cast<int>(*v);
    if (const bool* v = std::get_if<bool>(&value)) return *v ? 1 : 0;
    return 0;
}

float ConVar::getFloat() const
{
    if (const float* v = std::get_if<float>(&value)) return *v;
    if (const int* v = std::get_if<int>(&value)) return static_cast<float>(*v);
    if (const bool* v = std::get_if<bool>(&value)) return *v ? 1.0f : 0.0f;
    return 0.0f;
}

bool ConVar::getBool() const
{
    if (const bool* v = std::get_if<bool>(&value)) return *v;
    if (const int* v = std::get_if<int>(&value)) return *v != 0;
    if (const float* v = std::get_if<float>(&value)) return *v != 0.0f;
    return false;
}

const std::string& ConVar::getString() const
{
    static const std::string s_empty;
    const std::string* v = std::get_if<std::string>(&value);
    return v != nullptr ? *v : s_empty;
}

std::string ConVar::toString() const
{
    if (const int* v = std::get_if<int>(&value)) return std::to_string(*v);
    if (const float* v = std::get_if<float>(&value)) return fmt::format("{}", *v);
    if (const bool* v = std::get_if<bool>(&value)) return *v ? "1" : "0";
    return getString();
}

template<typename T>
T ConVar::clampToBounds(T number) const
{
    if (!bounded) {
        return number;
    }
    return std::clamp(number, static_cast<T>(min_value), static_cast<T>(max_value));
}

bool ConVar::setFromString(const std::string& text)
{
    if (locked && hasFlag(ConVarFlags::READ_ONLY)) {
        LOG_TETHER_WARN("{} is read-only after startup", name);
        return false;
    }

    bool parsed = true;
    if (std::holds_alternative<int>(default_value)) {
        int number = 0;
        parsed = parseInt(text, number);
        if (parsed) value = clampToBounds(number);
    } else if (std::holds_alternative<float>(default_value)) {
        float number = 0.0f;
        parsed = parseFloat(text, number);
        if (parsed) value = clampToBounds(number);
    } else if (std::holds_alternative<bool>(default_value)) {
        bool flag = false;
        parsed = parseBool(text, flag);
        if (parsed) value = flag;
    } else {
        value = text;
    }

    if (!parsed) {
        LOG_TETHER_WARN("{}: cannot use '{}' as a value", name, text);
    }
    return parsed;
}

void ConVar::reset()
{
    value = default_value;
}

bool ConVar::appliesTo(ConVarSide side) const
{
    switch (side) {
        case ConVarSide::Server: return !hasFlag(ConVarFlags::CLIENT_ONLY);
        case ConVarSide::Client: return !hasFlag(ConVarFlags::SERVER_ONLY);
        case ConVarSide::Any:    return true;
    }
    return true;
}

// =============================================================================
// ConVarRegistry
// =============================================================================

ConVarRegistry& ConVarRegistry::get()
{
    static ConVarRegistry instance;
    return instance;
}

void ConVarRegistry::add(ConVar* cvar)
{
    // Runs during static initialization, before logging exists
    std::lock_guard<std::mutex> lock(mutex);
    cvars.emplace(cvar->getName(), cvar);
}

void ConVarRegistry::remove(ConVar* cvar)
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cvars.find(cvar->getName());
    if (it != cvars.end() && it->second == cvar) {
        cvars.erase(it);
    }
}

ConVar* ConVarRegistry::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cvars.find(name);
    return it != cvars.end() ? it->second : nullptr;
}

void ConVarRegistry::lockReadOnly()
{
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& entry : cvars) {
        if (entry.second->hasFlag(ConVarFlags::READ_ONLY)) {
            entry.second->setLocked(true);
        }
    }
}

bool ConVarRegistry::loadConfig(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        LOG_TETHER_WARN("Config file not found: {}", filepath);
        return false;
    }

    LOG_TETHER_INFO("Loading config: {}", filepath);

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        applyLine(line, filepath, line_number);
    }
    return true;
}

bool ConVarRegistry::saveArchiveCvars(const std::string& filepath) const
{
    std::ofstream file(filepath);
    if (!file.is_open()) {
        LOG_TETHER_ERROR("Could not write config file: {}", filepath);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& entry : cvars) {
        const ConVar* cvar = entry.second;
        if (!cvar->hasFlag(ConVarFlags::ARCHIVE) || !cvar->appliesTo(side)) {
            continue;
        }
        file << cvar->getName() << " \"" << cvar->toString() << "\"\n";
    }

    if (!file) {
        LOG_TETHER_ERROR("Failed writing config file: {}", filepath);
        return false;
    }
    LOG_TETHER_INFO("Config saved to {}", filepath);
    return true;
}

int ConVarRegistry::applyCommandLine(int argc, char* argv[])
{
    int applied = 0;
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '+') {
            continue;
        }

        if (assign(arg.substr(1), argv[i + 1], "command line", i)) {
            applied++;
        }
        i++;
    }
    return applied;
}

bool ConVarRegistry::applyLine(const std::string& line, const std::string& source, int line_number)
{
    std::string trimmed = trim(line);
    if (trimmed.empty() || trimmed.compare(0, 2, "//") == 0) {
        return false;
    }

    size_t split = trimmed.find_first_of(" \t");
    if (split == std::string::npos) {
        LOG_TETHER_WARN("{}:{}: missing value for '{}'", source, line_number, trimmed);
        return false;
    }

    std::string text = trim(trimmed.substr(split + 1));
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        text = text.substr(1, text.size() - 2);
    }
    return assign(trimmed.substr(0, split), text, source, line_number);
}

bool ConVarRegistry::assign(const std::string& name, const std::string& text, const std::string& source,
                            int line_number)
{
    ConVar* cvar = find(name);
    if (cvar == nullptr) {
        LOG_TETHER_WARN("{}:{}: unknown cvar '{}'", source, line_number, name);
        return false;
    }

    if (!cvar->appliesTo(side)) {
        LOG_TETHER_WARN("{}:{}: '{}' belongs to the {} and is ignored here", source, line_number, name,
            cvar->hasFlag(ConVarFlags::SERVER_ONLY) ? "server" : "client");
        return false;
    }

    return cvar->setFromString(text);
}

} // namespace Tether
