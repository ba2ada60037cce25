#pragma once
/*
===============================================================================
ERRORS — Exception types raised by the factory planner
===============================================================================

OVERVIEW
--------
Failures are reported by exceptions rooted in the standard hierarchy, each
with a Kind enum so callers can branch without parsing messages:

• CatalogError  (std::invalid_argument) — a catalog failed validation while
                                          being built or loaded
• LookupError   (std::invalid_argument) — a name or value crossing the
                                          persistence boundary did not resolve
• SolveError    (std::runtime_error)    — the linear program has no optimum

Ids that do not belong to the catalog they are used with are programming
errors and surface as std::out_of_range from the catalog accessors.

===============================================================================
*/

#include <stdexcept>
#include <string>
#include <vector>
#include <format>
#include <utility>

namespace planner {

    // ============================================================================
    // CATALOG ERRORS
    // ============================================================================

    /**
     * @class CatalogError
     * @brief Raised by Catalog::build and Catalog::load
     */
    class CatalogError : public std::invalid_argument {
    public:
        enum class Kind {
            InvalidResourceId,  ///< a recipe rate points past the resource list
            UnknownResource,    ///< a recipe rate names a resource that does not exist
            DuplicateResource,  ///< two resources share a name
            DuplicateRecipe     ///< two recipes share a name
        };

        CatalogError(Kind kind, std::string recipeName, std::string resourceName)
            : std::invalid_argument(describe(kind, recipeName, resourceName)),
            kind_(kind),
            recipeName_(std::move(recipeName)),
            resourceName_(std::move(resourceName))
        {
        }

        Kind kind() const noexcept { return kind_; }

        /// @brief Offending recipe (empty for DuplicateResource)
        const std::string& recipeName() const noexcept { return recipeName_; }

        /// @brief Offending resource (empty for DuplicateRecipe)
        const std::string& resourceName() const noexcept { return resourceName_; }

    private:
        static std::string describe(Kind kind,
            const std::string& recipe,
            const std::string& resource)
        {
            switch (kind) {
            case Kind::InvalidResourceId:
                return std::format("recipe \"{}\" references invalid resource id {}",
                    recipe, resource);
            case Kind::UnknownResource:
                return std::format("recipe \"{}\" references unknown resource \"{}\"",
                    recipe, resource);
            case Kind::DuplicateResource:
                return std::format("duplicate resource name \"{}\"", resource);
            case Kind::DuplicateRecipe:
                return std::format("duplicate recipe name \"{}\"", recipe);
            }
            return "invalid catalog";
        }

        Kind kind_;
        std::string recipeName_;
        std::string resourceName_;
    };

    // ============================================================================
    // LOOKUP ERRORS
    // ============================================================================

    /**
     * @class LookupError
     * @brief Raised when named rules or factory entries cannot be resolved
     */
    class LookupError : public std::invalid_argument {
    public:
        enum class Kind {
            UnknownResource,
            UnknownRecipe,
            InvalidRate     ///< factory entry with a negative or non-finite rate
        };

        LookupError(Kind kind, std::string name)
            : std::invalid_argument(describe(kind, name)),
            kind_(kind),
            name_(std::move(name))
        {
        }

        Kind kind() const noexcept { return kind_; }
        const std::string& name() const noexcept { return name_; }

    private:
        static std::string describe(Kind kind, const std::string& name)
        {
            switch (kind) {
            case Kind::UnknownResource: return std::format("unknown resource \"{}\"", name);
            case Kind::UnknownRecipe:   return std::format("unknown recipe \"{}\"", name);
            case Kind::InvalidRate:     return std::format("invalid rate for recipe \"{}\"", name);
            }
            return "lookup failed";
        }

        Kind kind_;
        std::string name_;
    };

    // ============================================================================
    // SOLVE ERRORS
    // ============================================================================

    /**
     * @class SolveError
     * @brief Raised by Problem::solve when no optimal plan exists
     *
     * @details what() is exactly "Infeasible" or "Unbounded" for those two
     *          outcomes, suitable for showing to the user verbatim. For any
     *          other backend status (time limit, numerical trouble) the kind
     *          is SolverFailure and what() is the backend's status name.
     */
    class SolveError : public std::runtime_error {
    public:
        enum class Kind { Infeasible, Unbounded, SolverFailure };

        explicit SolveError(Kind kind,
            const std::string& detail = {},
            std::vector<std::string> conflicts = {})
            : std::runtime_error(describe(kind, detail)),
            kind_(kind),
            conflicts_(std::move(conflicts))
        {
        }

        Kind kind() const noexcept { return kind_; }

        /// @brief Names of rows in an irreducible infeasible subset, if computed
        const std::vector<std::string>& conflicts() const noexcept { return conflicts_; }

    private:
        static std::string describe(Kind kind, const std::string& detail)
        {
            switch (kind) {
            case Kind::Infeasible:    return "Infeasible";
            case Kind::Unbounded:     return "Unbounded";
            case Kind::SolverFailure: return detail.empty() ? "Solver failure" : detail;
            }
            return detail;
        }

        Kind kind_;
        std::vector<std::string> conflicts_;
    };

} // namespace planner
