#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <variant>

namespace Tether {

namespace ConVarFlags
{
    constexpr uint32_t NONE         = 0;
    constexpr uint32_t ARCHIVE      = 1 << 0;   // Written by saveArchiveCvars
    constexpr uint32_t SERVER_ONLY  = 1 << 1;   // Ignored in client configuration
    constexpr uint32_t CLIENT_ONLY  = 1 << 2;   // Ignored in server configuration
    constexpr uint32_t READ_ONLY    = 1 << 3;   // Fixed once lockReadOnly() ran
}

// Program whose configuration is being applied
enum class ConVarSide : uint8_t
{
    Any = 0,
    Server,
    Client
};

// Typed console variable. The type is fixed by the default value; text
// assignments are parsed as that type and numeric values are clamped to the
// bounds when there are any. Registers itself for its lifetime.
class ConVar
{
public:
    using Value = std::variant<int, float, bool, std::string>;

    ConVar(const char* name, int default_value, uint32_t flags, const char* description);
    ConVar(const char* name, float default_value, uint32_t flags, const char* description);
    ConVar(const char* name, bool default_value, uint32_t flags, const char* description);
    ConVar(const char* name, const char* default_value, uint32_t flags, const char* description);
    ConVar(const char* name, int default_value, int min_value, int max_value, uint32_t flags, const char* description);
    ConVar(const char* name, float default_value, float min_value, float max_value, uint32_t flags, const char* description);
    ~ConVar();

    ConVar(const ConVar&) = delete;
    ConVar& operator=(const ConVar&) = delete;

    const std::string& getName() const { return name; }
    const std::string& getDescription() const { return description; }
    bool hasFlag(uint32_t flag) const { return (flags & flag) != 0; }

    int getInt() const;
    float getFloat() const;
    bool getBool() const;
    const std::string& getString() const;

    // Text form used by config files
    std::string toString() const;

    // Parses text as the cvar's type. Fails on malformed numbers and on a locked READ_ONLY cvar.
    bool setFromString(const std::string& text);
    void reset();

    void setLocked(bool is_locked) { locked = is_locked; }
    bool isLocked() const { return locked; }

    // False when the cvar belongs to the other program
    bool appliesTo(ConVarSide side) const;

private:
    ConVar(const char* cvar_name, Value default_val, uint32_t cvar_flags, const char* cvar_description);

    template<typename T>
    T clampToBounds(T value) const;

    std::string name;
    std::string description;
    uint32_t flags;
    Value value;
    Value default_value;
    bool locked = false;

    bool bounded = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

// Name -> cvar lookup plus config file and command line handling
class ConVarRegistry
{
public:
    static ConVarRegistry& get();

    void add(ConVar* cvar);
    void remove(ConVar* cvar);
    ConVar* find(const std::string& name) const;

    // Assignments to cvars of the other program are skipped with a warning
    void setSide(ConVarSide program_side) { side = program_side; }
    ConVarSide getSide() const { return side; }

    // Call once startup configuration is applied
    void lockReadOnly();

    // "name value" lines; // comments; quoted values may contain spaces
    bool loadConfig(const std::string& filepath);
    bool saveArchiveCvars(const std::string& filepath) const;

    // Applies "+name value" pairs, returns the number applied
    int applyCommandLine(int argc, char* argv[]);

private:
    ConVarRegistry() = default;

    bool applyLine(const std::string& line, const std::string& source, int line_number);
    bool assign(const std::string& name, const std::string& text, const std::string& source, int line_number);

    std::map<std::string, ConVar*> cvars;
    mutable std::mutex mutex;
    ConVarSide side = ConVarSide::Any;
};

// Force initialization of default cvars (call at startup)
void InitializeDefaultCVars();

} // namespace Tether

#define CONVAR(name, defaultVal, flags, description) \
    static ::Tether::ConVar g_cvar_##name(#name, defaultVal, flags, description)

#define CONVAR_BOUNDED(name, defaultVal, minVal, maxVal, flags, description) \
    static ::Tether::ConVar g_cvar_##name(#name, defaultVal, minVal, maxVal, flags, description)

#define CVAR_PTR(name) ::Tether::ConVarRegistry::get().find(#name)

#define CVAR_INT(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getInt() : 0)
#define CVAR_FLOAT(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getFloat() : 0.0f)
#define CVAR_BOOL(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getBool() : false)
#define CVAR_STRING(name) (CVAR_PTR(name) ? CVAR_PTR(name)->getString() : std::string())
