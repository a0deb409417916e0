#pragma once

#include "../model/poolreg_errors.hpp"
#include <boost/noncopyable.hpp>
#include <string>

namespace poolreg {
namespace registry {

/**
 * @brief Scoped write marker.
 *
 * Registries serialize writes with a recursive mutex, so that collaborators
 * probed during a write can still call read accessors on the same thread.
 * A second write from that thread is refused here instead.
 *
 * Must be constructed while holding the registry mutex.
 */
struct NonReentrant: boost::noncopyable
{
    NonReentrant(bool &in_progress, const char *operation)
        : m_in_progress(in_progress)
    {
        model::require<model::ReentrancyError>(!m_in_progress
            , std::string(operation) + ": reentrant call during another write");
        m_in_progress = true;
    }

    ~NonReentrant()
    {
        m_in_progress = false;
    }

private:
    bool &m_in_progress;
};

} // namespace registry
} // namespace poolreg
