#include "engine/Continuation.hh"

#include <ostream>

namespace Coup {
namespace Engine {

std::ostream& operator<<(std::ostream& os, const EndTurn&)
{
    return os << "end turn";
}

std::ostream& operator<<(std::ostream& os, const AssassinateOpenBlock& c)
{
    return os << "open assassination block window (" << c.actorId << " -> "
        << c.targetId << ")";
}

std::ostream& operator<<(std::ostream& os, const AssassinateBlockStands&)
{
    return os << "assassination block stands";
}

std::ostream& operator<<(
    std::ostream& os, const AssassinateForceTargetLoss& c)
{
    return os << "force assassination target loss (" << c.actorId << " -> "
        << c.targetId << ")";
}

std::ostream& operator<<(std::ostream& os, const EndTurnAfterAssassination& c)
{
    return os << "end turn after assassination of " << c.targetId;
}

std::ostream& operator<<(std::ostream& os, const StealOpenBlock& c)
{
    return os << "open steal block window (" << c.actorId << " -> "
        << c.targetId << ")";
}

std::ostream& operator<<(std::ostream& os, const StealApply& c)
{
    return os << "apply steal (" << c.actorId << " <- " << c.targetId << ")";
}

std::ostream& operator<<(std::ostream& os, const StealBlockStands&)
{
    return os << "steal block stands";
}

std::ostream& operator<<(std::ostream& os, const StealApplyAfterBlockFail& c)
{
    return os << "apply steal after failed block (" << c.actorId << " <- "
        << c.targetId << ")";
}

std::ostream& operator<<(std::ostream& os, const ExchangeStartChoice& c)
{
    return os << "start exchange choice of " << c.actorId;
}

}
}
