#include "masklint/commands/maskfile_command.hpp"

#include "masklint/config/config.hpp"
#include "masklint/core/application_context.hpp"
#include "masklint/log/logger.hpp"
#include "masklint/maskfile/parser.hpp"

namespace masklint::commands {

maskfile::Maskfile MaskfileCommand::prepare(const cli::CommandContext& ctx) {
    core::ApplicationContext::instance().configure(
        ctx.get_flag("config"), ctx.is_user_provided("config"),
        ctx.get_flag("log-level"));

    std::string path = ctx.get_flag("maskfile");
    if (path.empty()) {
        path = config::ConfigPaths::DEFAULT_MASKFILE;
    }
    MASKLINT_LOG_INFO << "Running '" << name() << "' on " << path;
    return maskfile::load_maskfile(path);
}

}  // namespace masklint::commands
