#include "IRecordStrategy.hpp"
#include "CQueryBuilder.hpp"

namespace lap
{
namespace geo
{
    core::Result< void > ApplySchema( SqlEngine &engine ) noexcept
    {
        for ( const auto& ddl : QueryBuilder::SchemaStatements() ) {
            auto result = engine.ExecuteScript( ddl );
            if ( !result.HasValue() ) {
                LAP_GEO_LOG_ERROR << "Schema statement failed: " << ddl;
                return result;
            }
        }

        return core::Result< void >::FromValue();
    }
} // geo
} // lap
