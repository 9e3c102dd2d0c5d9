#include "crdt/document_replica.hpp"

namespace weave::crdt {

QString describe(const UpdateOrigin& origin) {
    switch (origin.source) {
        case UpdateOrigin::Source::Local:
            return QStringLiteral("local");
        case UpdateOrigin::Source::Remote:
            return QStringLiteral("remote(%1)").arg(origin.connection_id);
        case UpdateOrigin::Source::Persistence:
            return QStringLiteral("persistence");
    }
    return QStringLiteral("unknown");
}

} // namespace weave::crdt
