/**
 * @file uuid.cpp
 */
#include "stepdag/common/uuid.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace stepdag
{

std::string generate_uuid()
{
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace stepdag
