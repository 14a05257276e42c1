/*
 * ringview_log.hpp
 *
 * Diagnostics for views and sources, routed through Qt logging categories:
 *   - "ringview.view"   : view construction, filter attach/reset, reset
 *                         translations, disposal
 *   - "ringview.source" : evictions of fixed-size sources
 *
 * Both categories default to QtWarningMsg, so debug output stays silent
 * until enabled, e.g.:
 *   QT_LOGGING_RULES="ringview.*.debug=true"
 *
 * With RINGVIEW_ENABLE_LOGGING == 0 the macros expand to nothing and QtCore
 * is not included.
 */

#ifndef RINGVIEW_LOG_HPP_
#define RINGVIEW_LOG_HPP_

#include "ringview_config.hpp"

#if RINGVIEW_ENABLE_LOGGING

#include <QtCore/QLoggingCategory>
#include <QtCore/QDebug>

namespace ringview::log {

inline const QLoggingCategory& view()
{
    static const QLoggingCategory category("ringview.view", QtWarningMsg);
    return category;
}

inline const QLoggingCategory& source()
{
    static const QLoggingCategory category("ringview.source", QtWarningMsg);
    return category;
}

} // namespace ringview::log

// printf-style: RINGVIEW_LOG_DEBUG(view, "attached filter over %llu entries", n);
#  define RINGVIEW_LOG_DEBUG(cat, ...) qCDebug(::ringview::log::cat, __VA_ARGS__)
#  define RINGVIEW_LOG_WARN(cat, ...)  qCWarning(::ringview::log::cat, __VA_ARGS__)

#else

#  define RINGVIEW_LOG_DEBUG(cat, ...) do {} while (0)
#  define RINGVIEW_LOG_WARN(cat, ...)  do {} while (0)

#endif /* RINGVIEW_ENABLE_LOGGING */

#endif /* RINGVIEW_LOG_HPP_ */
