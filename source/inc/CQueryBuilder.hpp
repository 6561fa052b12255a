/**
 * @file CQueryBuilder.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Schema DDL and parameterized statements for the location_history table
 * @version 0.1
 * @date 2024-02-02
 *
 * Record content is never spliced into statement text. Every value travels
 * as a bound parameter; text the engine cannot store losslessly is rejected
 * with GeoErrc::kUnsafeValue instead of being altered.
 */
#ifndef LAP_GEOHISTORY_QUERYBUILDER_HPP
#define LAP_GEOHISTORY_QUERYBUILDER_HPP

#include <lap/core/CResult.hpp>

#include "CDataType.hpp"
#include "CLocationRecord.hpp"

namespace lap
{
namespace geo
{
    class QueryBuilder final
    {
    public:
        // DDL, all IF NOT EXISTS
        static core::Vector< core::String >             SchemaStatements() noexcept;

        // Mutations
        static core::Result< SqlStatement >             Insert( const LocationRecord& record ) noexcept;
        static core::Result< SqlStatement >             DeleteById( core::StringView id ) noexcept;
        static SqlStatement                             DeleteAll() noexcept;

        // Queries
        static SqlStatement                             SelectSummaries( core::UInt32 limit ) noexcept;
        static core::Result< SqlStatement >             SelectById( core::StringView id ) noexcept;
        static core::Result< SqlStatement >             Search( core::StringView term, core::UInt32 limit ) noexcept;
        static SqlStatement                             SelectAll() noexcept;
        static SqlStatement                             CountAll() noexcept;
        static SqlStatement                             CountBySource( RecordSource source ) noexcept;
        static SqlStatement                             CountSince( core::Int64 timestampMs ) noexcept;

        /**
         * @brief Check a text value before it is bound
         * @return kUnsafeValue for malformed UTF-8 or an embedded NUL
         */
        static core::Result< void >                     CheckText( core::StringView value ) noexcept;

        /**
         * @brief Escape LIKE wildcards so the term matches as a literal substring
         *
         * '\', '%' and '_' are prefixed with '\', used as ESCAPE character.
         */
        static core::String                             EscapeLikePattern( core::StringView term ) noexcept;

        static const core::Char*                        RecordColumns() noexcept;
        static const core::Char*                        SummaryColumns() noexcept;

    private:
        QueryBuilder() = delete;
    };

} // geo
} // lap

#endif
