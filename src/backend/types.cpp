#include <timber_mcp/backend/types.hpp>

namespace timber_mcp {

const char* ProvenanceName(Provenance provenance) {
    switch (provenance) {
        case Provenance::LocalSimulation: return "local_simulation";
        case Provenance::KnowledgeBase:   return "knowledge_base";
        case Provenance::Error:           return "error";
    }
    return "error";
}

} // namespace timber_mcp
