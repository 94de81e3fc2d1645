/** \file
 *
 * \brief Definition of Coup::Messaging::SerializationFailureException class
 */

#ifndef MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
#define MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_

#include <exception>

namespace Coup {

/** \brief Conversions between engine objects and their wire presentation
 */
namespace Messaging {

/** \brief Exception to indicate error in serialization or deserialization
 *
 * This non-fatal exception is used by the JSON converters to signal that an
 * object could not be serialized, or that the JSON does not describe a valid
 * object.
 */
class SerializationFailureException : public std::exception {};

}
}

#endif // MESSAGING_SERIALIZATIONFAILUREEXCEPTION_HH_
