#include "format.h"

#include "annotated_error.h"

namespace stackerr::core::error {

std::string to_string(const Error& err, RenderMode mode, const TraceConfig& config) {
    if (!err) {
        return "<nil>";
    }

    switch (mode) {
        case RenderMode::Quoted:
            return fmt::format("{:?}", err.message());

        case RenderMode::Verbose: {
            std::string text = err.message();
            if (const StackCarrier* carrier = err->provenance()) {
                text += carrier->stack().format(true, config);
            }
            return text;
        }

        case RenderMode::Compact:
        default:
            return err.message();
    }
}

} // namespace stackerr::core::error
