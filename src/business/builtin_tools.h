// src/business/builtin_tools.h
#pragma once

#include "tool_registry.h"

namespace treescout::business {

    /**
     * @brief Register every built-in tool, in the order tools/list reports them:
     *        list_files, list_files_readable, list_files_table,
     *        list_files_metadata_only, pagination_plan, start_stream,
     *        next_stream, stop_stream, stream_files, track_usage, usage_summary,
     *        analyze_code, system_health.
     */
    void register_builtin_tools(ToolRegistry &registry);

}// namespace treescout::business
