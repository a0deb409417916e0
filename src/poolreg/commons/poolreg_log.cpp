#include "poolreg_log.hpp"
#include <iostream>
#include <mutex>
#include <exception>

struct status_holder {
    // allocated on heap at first registration, so that no sink object
    // needs to be built statically (nor destroyed at exit, while a hosting
    // interpreter may already be gone)
    log_sink_t functor;
    std::mutex mutex;
};

static status_holder *m_status = nullptr;
static log_level m_current_level = log_level_info;


bool log_trigger(log_level lvl)
{
    return lvl >= m_current_level;
}

log_level log_get_level()
{
    return m_current_level;
}

void log_set_level(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:
    case log_level_debug:
    case log_level_info:
    case log_level_warning:
    case log_level_error:
        m_current_level = lvl;
        break;
    default:
        break;
    }
}


void log_register_sink(log_sink_t sink)
{
    if (m_status == nullptr) m_status = new status_holder;
    std::lock_guard<std::mutex> lock(m_status->mutex);
    m_status->functor = std::move(sink);
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl)) return;
    if (m_status == nullptr) return;
    std::lock_guard<std::mutex> lock(m_status->mutex);
    if (!m_status->functor) return;
    try {
        m_status->functor(lvl, msg);
    } catch (const std::exception &e) {
        // sink failures end up on stderr
        std::cerr << "log sink failure: " << e.what() << " (message was: " << msg << ")" << std::endl;
    }
}
