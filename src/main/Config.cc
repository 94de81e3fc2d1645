#include "main/Config.hh"

#include "IoUtility.hh"
#include "Logging.hh"

#include <array>
#include <cerrno>
#include <cstring>
#include <exception>
#include <istream>
#include <memory>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Coup {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto PLAYERS = "players"sv;
constexpr auto PLAYER_ID = "id"sv;
constexpr auto PLAYER_NAME = "name"sv;
constexpr auto LOG_RETENTION = "log_retention"sv;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Would throw exception here but this is extern "C"...
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (s) {
        const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
        auto error = lua_load(
            lua, config_lua_reader, reader_args.get(), "config", nullptr);
        if (!error) {
            const auto out_of_memory_handler =
                std::set_new_handler(std::terminate);
            error = lua_pcall(lua, 0, 0, 0);
            std::set_new_handler(out_of_memory_handler);
        }
        if (error) {
            log(LogLevel::ERROR, "Error while running config script: %s",
                lua_tostring(lua, -1));
            throw std::runtime_error {"Could not process config"};
        }
    } else {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
}

std::optional<int> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        if (std::in_range<int>(ret)) {
            return static_cast<int>(ret);
        }
        log(LogLevel::WARNING, "Integer out of range: %s", key);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

// Reads string field of the table on the top of the stack
std::optional<std::string> getStringField(
    lua_State* lua, std::string_view key)
{
    lua_pushstring(lua, key.data());
    LuaPopGuard guard {lua};
    lua_rawget(lua, -2);
    if (lua_type(lua, -1) == LUA_TSTRING) {
        return lua_tostring(lua, -1);
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "%s: expected %s to be a string", PLAYERS, key);
    }
    return std::nullopt;
}

}

class Config::Impl {
public:

    Impl();
    Impl(std::istream& in);

    const Engine::PlayerInfoVector& getPlayers() const;
    int getLogRetention() const;

private:

    void createPlayersConfig(lua_State* lua);
    void createLogRetentionConfig(lua_State* lua);

    Engine::PlayerInfoVector players {};
    int logRetention {DEFAULT_LOG_RETENTION};
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    createPlayersConfig(lua.get());
    createLogRetentionConfig(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createPlayersConfig(lua_State* lua)
{
    lua_getglobal(lua, PLAYERS.data());
    LuaPopGuard guard {lua};
    if (lua_isnoneornil(lua, -1)) {
        return;
    }
    if (!lua_istable(lua, -1)) {
        log(LogLevel::WARNING, "Expected table: %s", PLAYERS);
        return;
    }
    for (auto i = 1;; ++i) {
        LuaPopGuard guard2 {lua};
        lua_rawgeti(lua, -1, i);
        if (lua_isnil(lua, -1)) {
            break;
        }
        if (!lua_istable(lua, -1)) {
            log(LogLevel::WARNING, "%s: expected player to be a table",
                PLAYERS);
            continue;
        }
        auto id = getStringField(lua, PLAYER_ID);
        if (!id) {
            log(LogLevel::WARNING, "%s: expected player to have %s",
                PLAYERS, PLAYER_ID);
            continue;
        }
        auto name = getStringField(lua, PLAYER_NAME);
        players.emplace_back(
            Engine::PlayerInfo {*id, name.value_or(*id)});
    }
}

void Config::Impl::createLogRetentionConfig(lua_State* lua)
{
    if (const auto log_retention = getInt(lua, LOG_RETENTION)) {
        if (*log_retention > 0) {
            logRetention = *log_retention;
        } else {
            log(LogLevel::WARNING, "Expected positive integer: %s",
                LOG_RETENTION);
        }
    }
}

const Engine::PlayerInfoVector& Config::Impl::getPlayers() const
{
    return players;
}

int Config::Impl::getLogRetention() const
{
    return logRetention;
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

const Engine::PlayerInfoVector& Config::getPlayers() const
{
    return impl->getPlayers();
}

int Config::getLogRetention() const
{
    return impl->getLogRetention();
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    } else {
        errno = 0;
        return processStreamFromPath(
            path, [](auto& in) { return Config {in}; });
    }
}

}
}
