#include "ammr_log.hpp"
#include <mutex>

struct status_holder {
    // allocated on first registration, never at static init time:
    // the sink may wrap objects owned by an embedding interpreter
    log_sink_t functor;
};

static status_holder *m_status = nullptr;
static log_level m_current_level = log_level_info;
static std::mutex m_sink_mutex;


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
    std::lock_guard<std::mutex> lock(m_sink_mutex);
    if (m_status == nullptr) m_status = new status_holder;
    m_status->functor = std::move(sink);
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl)) return;
    std::lock_guard<std::mutex> lock(m_sink_mutex);
    if (m_status == nullptr || !m_status->functor) return;
    m_status->functor(lvl, msg.c_str());
}
