#ifndef _libterragraph_Exception_h_
#define _libterragraph_Exception_h_

#include <stdexcept>
#include <string>

namespace Terragraph {

// Derived exceptions, so that the pipeline may tell
// tile-local, geometric and store failures apart from bugs.
#define TERRAGRAPH_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { \
    public: \
        DERIVED_EXCEPTION(const char* what_arg) : PARENT_EXCEPTION(what_arg) {} \
        DERIVED_EXCEPTION(const std::string& what_arg) : PARENT_EXCEPTION(what_arg) {} \
    };

class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
// Fatal for the current operation, the caller decides whether the whole run dies.
TERRAGRAPH_DERIVE_EXCEPTION(CriticalException, Exception);
TERRAGRAPH_DERIVE_EXCEPTION(RuntimeError, CriticalException);
TERRAGRAPH_DERIVE_EXCEPTION(LogicError, CriticalException);
TERRAGRAPH_DERIVE_EXCEPTION(InvalidArgument, LogicError);
TERRAGRAPH_DERIVE_EXCEPTION(ConfigError, InvalidArgument);
// The geometry engine could not compute a result for the given input.
TERRAGRAPH_DERIVE_EXCEPTION(GeometryError, RuntimeError);
// Voronoi generation failed after the whole escalation chain.
TERRAGRAPH_DERIVE_EXCEPTION(VoronoiError, GeometryError);
TERRAGRAPH_DERIVE_EXCEPTION(StoreError, RuntimeError);
// An edge references a vertex the merger never saw.
TERRAGRAPH_DERIVE_EXCEPTION(ReconciliationError, RuntimeError);

#undef TERRAGRAPH_DERIVE_EXCEPTION

} // namespace Terragraph

#endif // _libterragraph_Exception_h_
