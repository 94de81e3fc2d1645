/** \file
 *
 * \brief Definition of Coup::Main::GameSession class
 *
 * \page coupprotocol Coup line protocol
 *
 * The command line driver reads one JSON request per line and writes one
 * JSON reply per line. The requests are:
 *
 * \code{.json}
 * { "command": "initiate", "player": <id>, "action": <action>, "target": <id> }
 * { "command": "respond", "player": <id>, "response": <response> }
 * { "command": "view", "player": <id> }
 * \endcode
 *
 * - &lt;action&gt; is described in \ref jsonactiontype. An unknown action
 *   name is passed to the engine, which rejects it.
 * - &lt;response&gt; is described in \ref jsonresponse
 * - "target" is optional, and so is "player" in "view"
 *
 * The reply to an accepted or rejected request is:
 *
 * \code{.json}
 * {
 *     "diagnostic": <diagnostic>,
 *     "log": [ <entry>, ... ],
 *     "private": [ <privateMessage>, ... ],
 *     "view": <view>
 * }
 * \endcode
 *
 * - &lt;diagnostic&gt; and &lt;privateMessage&gt; are described in
 *   \ref jsonoutcome
 * - &lt;view&gt; is the view of the requesting player, see \ref jsongameview
 *
 * A request that cannot be parsed is answered with
 * <tt>{ "error": "malformed request" }</tt>.
 */

#ifndef MAIN_GAMESESSION_HH_
#define MAIN_GAMESESSION_HH_

#include "engine/CoupEngine.hh"

#include <boost/core/noncopyable.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace Coup {
namespace Main {

class Config;

/** \brief A local game driven by line requests
 *
 * GameSession owns the engine of a single game and performs the duties of
 * the transport towards it: only the player having the turn may initiate an
 * action, and each reply contains the view of the requesting player only.
 */
class GameSession : private boost::noncopyable {
public:

    /** \brief Create new session
     *
     * If \p config contains no players, the game is played by two players
     * with identifiers “p1” and “p2”.
     *
     * \param config the configuration
     *
     * \throw std::invalid_argument if the configured players do not form a
     * valid game
     */
    explicit GameSession(const Config& config);

    /** \brief Process a single request
     *
     * \param request the request line
     *
     * \return the reply line, without terminating newline
     */
    std::string processRequest(std::string_view request);

    /** \brief Process requests until the end of stream
     *
     * Empty lines are skipped.
     *
     * \param in the stream the requests are read from
     * \param out the stream the replies are written to
     */
    void run(std::istream& in, std::ostream& out);

    /** \brief Get the engine
     */
    const Engine::CoupEngine& getEngine() const;

private:

    Engine::CoupEngine engine;
};

}
}

#endif // MAIN_GAMESESSION_HH_
