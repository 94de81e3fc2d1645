#include "engine/Outcome.hh"

#include <array>
#include <ostream>

namespace Coup {
namespace Engine {

namespace {

using Entry = DiagnosticToStringMap::value_type;

const auto DIAGNOSTIC_NAMES = std::array {
    Entry {Diagnostic::NONE, "none"},
    Entry {Diagnostic::NO_PENDING_ACTION, "noPendingAction"},
    Entry {Diagnostic::ACTION_PENDING, "actionPending"},
    Entry {Diagnostic::GAME_OVER, "gameOver"},
    Entry {Diagnostic::UNKNOWN_PLAYER, "unknownPlayer"},
    Entry {Diagnostic::MUST_COUP, "mustCoup"},
    Entry {Diagnostic::UNKNOWN_ACTION, "unknownAction"},
    Entry {Diagnostic::INVALID_TARGET, "invalidTarget"},
    Entry {Diagnostic::INSUFFICIENT_COINS, "insufficientCoins"},
    Entry {Diagnostic::NOT_ELIGIBLE, "notEligible"},
    Entry {Diagnostic::UNEXPECTED_RESPONSE, "unexpectedResponse"},
    Entry {Diagnostic::INVALID_CARD, "invalidCard"},
    Entry {Diagnostic::INVALID_CHOICE, "invalidChoice"},
};

}

const DiagnosticToStringMap DIAGNOSTIC_TO_STRING_MAP(
    DIAGNOSTIC_NAMES.begin(), DIAGNOSTIC_NAMES.end());

std::ostream& operator<<(std::ostream& os, const Diagnostic diagnostic)
{
    return os << DIAGNOSTIC_TO_STRING_MAP.left.at(diagnostic);
}

}
}
