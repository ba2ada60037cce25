#pragma once
/*
===============================================================================
REPORT — Plain-text rendering of factories and net resource flows
===============================================================================

OVERVIEW
--------
Renders solve results as text for display or logging. Nothing here prints;
callers decide where the text goes.

    formatNetResources(catalog, net)
        Ore net -60 /min
          Smelt -60 /min
        Ingot net 60 /min
          Smelt 60 /min

    formatFactory(catalog, factory)
        Smelt 2 machines
          Ore -60 /min
          Ingot 60 /min

Resources without contributing recipes are skipped. Numbers are printed with
up to 7 decimals and trailing zeros removed.

===============================================================================
*/

#include <format>
#include <string>

#include "catalog.h"
#include "factory.h"

namespace planner {

    namespace report_detail {

        /// @brief Fixed 7-decimal rendering with trailing zeros removed
        inline std::string number(double value)
        {
            std::string text = std::format("{:.7f}", value);

            auto dot = text.find('.');
            if (dot != std::string::npos) {
                auto last = text.find_last_not_of('0');
                text.erase(last == dot ? dot : last + 1);
            }

            if (text == "-0")
                text = "0";
            return text;
        }

    } // namespace report_detail

    inline std::string formatNetResources(const Catalog& catalog, const NetResources& net)
    {
        std::string out;

        for (std::size_t r = 0; r < net.resources.size(); ++r) {
            const auto& flow = net.resources[r];
            if (flow.contributions.empty())
                continue;

            out += std::format("{} net {} /min\n",
                catalog.nameOf(ResourceId{ r }), report_detail::number(flow.netRate));

            for (const auto& [recipe, rate] : flow.contributions) {
                out += std::format("  {} {} /min\n",
                    catalog.nameOf(recipe), report_detail::number(rate));
            }
        }

        return out;
    }

    inline std::string formatFactory(const Catalog& catalog, const Factory& factory)
    {
        std::string out;

        for (const auto& [recipe, throughput] : factory.recipes) {
            out += std::format("{} {} machines\n",
                catalog.nameOf(recipe), report_detail::number(throughput));

            for (const auto& [resource, rate] : catalog.recipe(recipe).rates) {
                out += std::format("  {} {} /min\n",
                    catalog.nameOf(resource), report_detail::number(throughput * rate));
            }
        }

        return out;
    }

} // namespace planner
