#pragma once
/*
===============================================================================
DIAGNOSTICS — Status names, model statistics and IIS extraction
===============================================================================

Overview
--------
Free functions on GRBModel used by the Gurobi backend and available to
callers that want to log what a solve did:

    * statusString()       GRB_OPTIMAL -> "OPTIMAL"
    * computeStatistics()  variable, row and non-zero counts
    * modelSummary()       "5 vars, 9 constrs, 7 nonzeros"
    * computeIIS()         positions of the rows and bounds forming an
                           irreducible inconsistent subsystem

Positions reported by computeIIS() are model order, which for planner models
is LinearProgram order, so they index program.rows() and program.columns()
directly.

===============================================================================
*/

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "gurobi_c++.h"

namespace planner {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numNonZeros = 0;
};

/// @note Call after the model has been updated or optimized
inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;
    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    return stats;
}

inline std::string modelSummary(const GRBModel& model) {
    auto stats = computeStatistics(model);
    return std::to_string(stats.numVars) + " vars, "
        + std::to_string(stats.numConstrs) + " constrs, "
        + std::to_string(stats.numNonZeros) + " nonzeros";
}

// =============================================================================
// IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
// =============================================================================

/**
 * @brief Rows and variable bounds that are infeasible together
 *
 * @details Removing any single element makes the rest feasible.
 */
struct IISResult {
    std::vector<int> constraints;   ///< row positions
    std::vector<int> lowerBounds;   ///< column positions
    std::vector<int> upperBounds;   ///< column positions

    bool empty() const {
        return constraints.empty() && lowerBounds.empty() && upperBounds.empty();
    }

    std::size_t size() const {
        return constraints.size() + lowerBounds.size() + upperBounds.size();
    }
};

/**
 * @brief Compute an IIS for an infeasible model
 *
 * @note Only meaningful when the status is INFEASIBLE
 * @throws GRBException if the model is not infeasible
 */
inline IISResult computeIIS(GRBModel& model) {
    IISResult result;

    model.computeIIS();

    int numConstrs = model.get(GRB_IntAttr_NumConstrs);
    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());

    for (int i = 0; i < numConstrs; ++i) {
        if (constrs[i].get(GRB_IntAttr_IISConstr) > 0) {
            result.constraints.push_back(i);
        }
    }

    int numVars = model.get(GRB_IntAttr_NumVars);
    std::unique_ptr<GRBVar[]> vars(model.getVars());

    for (int i = 0; i < numVars; ++i) {
        if (vars[i].get(GRB_IntAttr_IISLB) > 0) {
            result.lowerBounds.push_back(i);
        }
        if (vars[i].get(GRB_IntAttr_IISUB) > 0) {
            result.upperBounds.push_back(i);
        }
    }

    return result;
}

} // namespace planner
