#include "coup/Card.hh"

#include <ostream>

namespace Coup {

std::ostream& operator<<(std::ostream& os, const Card& card)
{
    os << card.role;
    if (card.revealed) {
        os << " (revealed)";
    }
    return os;
}

}
