// Lua configuration loading.
#include <filesystem>
#include <optional>
#include <raylib.h>
#include "../include/Scripting/ConfigScript.hpp"
#include "../include/Config/GameConfig.hpp"

#include <lua.hpp>

namespace {

// Reads typed fields out of one Config sub-table.  The first failure is
// kept; later reads become no-ops.
class FieldReader {
public:
    FieldReader(lua_State* L, int table, const char* section)
        : L(L), m_table(lua_absindex(L, table)), m_section(section) {}

    bool ok() const { return m_error.empty(); }
    const std::string& error() const { return m_error; }

    void number(const char* key, float& out)
    {
        if (!push(key)) return;
        if (lua_type(L, -1) != LUA_TNUMBER) fail(key, "a number");
        else out = (float)lua_tonumber(L, -1);
        lua_pop(L, 1);
    }

    void optionalNumber(const char* key, std::optional<float>& out)
    {
        float v = 0.0f;
        bool present = has(key);
        number(key, v);
        if (present && ok()) out = v;
    }

    void integer(const char* key, int& out)
    {
        if (!push(key)) return;
        if (!lua_isinteger(L, -1)) fail(key, "an integer");
        else out = (int)lua_tointeger(L, -1);
        lua_pop(L, 1);
    }

    void string(const char* key, std::string& out)
    {
        if (!push(key)) return;
        if (lua_type(L, -1) != LUA_TSTRING) fail(key, "a string");
        else out = lua_tostring(L, -1);
        lua_pop(L, 1);
    }

    void vec3(const char* key, Vector3& out)
    {
        if (!push(key)) return;
        float v[3] = { 0.0f, 0.0f, 0.0f };
        if (!lua_istable(L, -1) || lua_rawlen(L, -1) != 3) {
            fail(key, "a {x, y, z} array");
        } else {
            for (int i = 0; i < 3 && ok(); ++i) {
                lua_rawgeti(L, -1, i + 1);
                if (lua_type(L, -1) != LUA_TNUMBER) fail(key, "a {x, y, z} array");
                else v[i] = (float)lua_tonumber(L, -1);
                lua_pop(L, 1);
            }
            if (ok()) out = { v[0], v[1], v[2] };
        }
        lua_pop(L, 1);
    }

    void color(const char* key, Color& out)
    {
        if (!push(key)) return;
        int c[4] = { 0, 0, 0, 255 };
        lua_Unsigned n = lua_istable(L, -1) ? lua_rawlen(L, -1) : 0;
        if (n != 3 && n != 4) {
            fail(key, "a {r, g, b[, a]} array");
        } else {
            for (int i = 0; i < (int)n && ok(); ++i) {
                lua_rawgeti(L, -1, i + 1);
                if (!lua_isinteger(L, -1) || lua_tointeger(L, -1) < 0 || lua_tointeger(L, -1) > 255)
                    fail(key, "a {r, g, b[, a]} array of 0-255 integers");
                else
                    c[i] = (int)lua_tointeger(L, -1);
                lua_pop(L, 1);
            }
            if (ok()) out = { (unsigned char)c[0], (unsigned char)c[1], (unsigned char)c[2], (unsigned char)c[3] };
        }
        lua_pop(L, 1);
    }

    void stepMode(const char* key, MarbleRun::Physics::StepMode& out)
    {
        std::string mode;
        bool present = has(key);
        string(key, mode);
        if (!present || !ok()) return;
        if (mode == "variable")   out = MarbleRun::Physics::StepMode::Variable;
        else if (mode == "fixed") out = MarbleRun::Physics::StepMode::Fixed;
        else fail(key, "\"variable\" or \"fixed\"");
    }

private:
    bool has(const char* key)
    {
        lua_getfield(L, m_table, key);
        bool present = !lua_isnil(L, -1);
        lua_pop(L, 1);
        return present;
    }

    // Pushes the field; returns false with the stack unchanged when absent.
    bool push(const char* key)
    {
        if (!ok()) return false;
        lua_getfield(L, m_table, key);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            return false;
        }
        return true;
    }

    void fail(const char* key, const char* what)
    {
        if (ok()) m_error = "Config." + m_section + "." + key + " must be " + what;
    }

    lua_State*  L;
    int         m_table;
    std::string m_section;
    std::string m_error;
};

} // anonymous namespace

namespace MarbleRun::Scripting {

ConfigScript::ConfigScript()
    : L(nullptr)
{
}

ConfigScript::~ConfigScript()
{
    if (L) lua_close(L);
}

bool ConfigScript::init()
{
    if (L) lua_close(L);
    L = luaL_newstate();
    if (!L) {
        m_lastLuaError = "could not create Lua state";
        return false;
    }
    luaL_openlibs(L);
    return true;
}

bool ConfigScript::Load(const std::string& path, GameConfig& cfg)
{
    m_lastLuaError.clear();
    if (!std::filesystem::exists(path)) {
        m_lastLuaError = "config script not found: " + path;
        TraceLog(LOG_ERROR, "[Config] %s", m_lastLuaError.c_str());
        return false;
    }
    if (!init()) {
        TraceLog(LOG_ERROR, "[Config] %s", m_lastLuaError.c_str());
        return false;
    }

    int status = luaL_loadfile(L, path.c_str());
    if (status == LUA_OK) status = lua_pcall(L, 0, 0, 0);
    if (status != LUA_OK) {
        const char* msg = lua_tostring(L, -1);
        m_lastLuaError = msg ? msg : "<unknown>";
        TraceLog(LOG_ERROR, "[Config] Script error: %s", m_lastLuaError.c_str());
        lua_pop(L, 1);
        return false;
    }

    GameConfig staged = cfg;
    if (!apply(staged)) {
        TraceLog(LOG_ERROR, "[Config] %s", m_lastLuaError.c_str());
        return false;
    }

    std::string invalid;
    if (!ValidateConfig(staged, invalid)) {
        m_lastLuaError = invalid;
        TraceLog(LOG_ERROR, "[Config] %s", m_lastLuaError.c_str());
        return false;
    }

    cfg = staged;
    TraceLog(LOG_INFO, "[Config] Loaded %s", path.c_str());
    return true;
}

bool ConfigScript::apply(GameConfig& cfg)
{
    lua_getglobal(L, "Config");
    if (!lua_istable(L, -1)) {
        m_lastLuaError = "script must declare a global 'Config' table";
        lua_pop(L, 1);
        return false;
    }
    const int root = lua_gettop(L);

    // Runs `read` on Config.<name> when that sub-table exists.
    auto section = [&](const char* name, auto read) -> bool {
        lua_getfield(L, root, name);
        if (lua_isnil(L, -1)) {
            lua_pop(L, 1);
            return true;
        }
        if (!lua_istable(L, -1)) {
            m_lastLuaError = std::string("Config.") + name + " must be a table";
            lua_pop(L, 1);
            return false;
        }
        FieldReader r(L, -1, name);
        read(r);
        lua_pop(L, 1);
        if (!r.ok()) m_lastLuaError = r.error();
        return r.ok();
    };

    bool ok =
        section("window", [&](FieldReader& r) {
            r.integer("width", cfg.window.width);
            r.integer("height", cfg.window.height);
            r.string("title", cfg.window.title);
            r.integer("targetFps", cfg.window.targetFps);
        }) &&
        section("world", [&](FieldReader& r) {
            r.vec3("gravity", cfg.world.gravity);
            r.stepMode("stepMode", cfg.world.mode);
            r.number("maxStep", cfg.world.maxStep);
            r.integer("substeps", cfg.world.substeps);
            r.number("timeScale", cfg.world.timeScale);
            r.number("lengthUnit", cfg.world.lengthUnit);
        }) &&
        section("track", [&](FieldReader& r) {
            r.number("width", cfg.track.width);
            r.number("depth", cfg.track.depth);
            r.number("floorThickness", cfg.track.floorThickness);
            r.number("wallHeight", cfg.track.wallHeight);
            r.number("wallThickness", cfg.track.wallThickness);
            r.number("slope", cfg.track.slopeDegrees);
            r.number("floorFriction", cfg.track.floorFriction);
            r.optionalNumber("wallFriction", cfg.track.wallFriction);
        }) &&
        section("marble", [&](FieldReader& r) {
            r.number("radius", cfg.marble.radius);
            r.number("density", cfg.marble.density);
            r.number("friction", cfg.marble.friction);
            r.number("restitution", cfg.marble.restitution);
            r.vec3("start", cfg.marble.start);
            r.vec3("initialVelocity", cfg.marble.initialVelocity);
            r.number("respawnHeight", cfg.marble.respawnHeight);
            r.color("color", cfg.marble.color);
        }) &&
        section("camera", [&](FieldReader& r) {
            r.number("offsetY", cfg.camera.offsetY);
            r.number("offsetZ", cfg.camera.offsetZ);
            r.number("smoothing", cfg.camera.smoothingRate);
            r.number("lookAhead", cfg.camera.lookAhead);
            r.number("lookDrop", cfg.camera.lookDrop);
            r.number("fovy", cfg.camera.fovy);
        }) &&
        section("controls", [&](FieldReader& r) {
            r.number("force", cfg.controls.force);
        }) &&
        section("lighting", [&](FieldReader& r) {
            r.vec3("sunDirection", cfg.lighting.sunDirection);
            r.color("sunColor", cfg.lighting.sunColor);
            r.number("illuminance", cfg.lighting.illuminance);
            r.color("ambientColor", cfg.lighting.ambientColor);
            r.number("ambient", cfg.lighting.ambient);
        });

    lua_pop(L, 1); // Config
    return ok;
}

} // namespace MarbleRun::Scripting
