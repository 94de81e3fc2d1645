#include "coup/Response.hh"

#include <ostream>

namespace Coup {

std::ostream& operator<<(std::ostream& os, const PassResponse&)
{
    return os << "pass";
}

std::ostream& operator<<(std::ostream& os, const ChallengeResponse&)
{
    return os << "challenge";
}

std::ostream& operator<<(std::ostream& os, const BlockResponse& response)
{
    return os << "block with " << response.role;
}

std::ostream& operator<<(
    std::ostream& os, const LoseInfluenceResponse& response)
{
    return os << "lose influence " << response.cardIndex;
}

std::ostream& operator<<(
    std::ostream& os, const ExchangeChoiceResponse& response)
{
    os << "keep";
    for (const auto& id : response.keep) {
        os << " " << id;
    }
    return os;
}

}
