/** \file
 *
 * \brief Definition of Coup::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "engine/GameState.hh"

#include <iosfwd>
#include <memory>
#include <string_view>

namespace Coup {

/** \brief The command line driver
 */
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration is a Lua script. The following globals are recognized:
 *
 * \code{.lua}
 * players = {
 *     { id = "alice", name = "Alice" },
 *     { id = "bob" },
 * }
 * log_retention = 40
 * \endcode
 *
 * - \c players is the roster of the game in seating order. The name
 *   defaults to the identifier.
 * - \c log_retention is the number of trailing log entries included in the
 *   views of the game.
 *
 * Other globals are ignored. Values of wrong type are ignored with a
 * warning.
 */
class Config {
public:

    /** \brief Create empty configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the configured players
     *
     * \return the players in seating order, or empty vector if none are
     * configured
     */
    const Engine::PlayerInfoVector& getPlayers() const;

    /** \brief Get the number of retained log entries
     */
    int getLogRetention() const;

private:

    class Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, empty configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
