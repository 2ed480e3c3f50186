#ifndef libterragraph_MemorySpatialStore_hpp_
#define libterragraph_MemorySpatialStore_hpp_

#include "SpatialStore.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Terragraph {

class MemoryStoreSession;

// In-process SpatialStore. Namespaces are maps of relations guarded by one
// mutex, spatial indexes are Boost.Geometry R-trees over the row bounding boxes.
class MemorySpatialStore : public SpatialStore
{
public:
    MemorySpatialStore();
    ~MemorySpatialStore() override;

    std::unique_ptr<StoreSession> open_session() override;

    // Called before every mutating operation with the operation name ("write_points",
    // "drop_namespace", "publish_namespace" ...) and the namespace it targets.
    // Throwing from the hook fails the operation, which is how failures are injected.
    using FaultHook = std::function<void(const std::string &operation, const std::string &ns)>;
    void set_fault_hook(FaultHook hook);

    size_t sessions_opened() const;

private:
    struct Relation;
    struct Namespace;

    mutable std::mutex                               m_mutex;
    std::map<std::string, std::shared_ptr<Namespace>> m_namespaces;
    FaultHook                                        m_fault_hook;
    size_t                                           m_sessions_opened { 0 };

    friend class MemoryStoreSession;
};

} // namespace Terragraph

#endif // libterragraph_MemorySpatialStore_hpp_
