#include "motionmux/build_info.h"

#include "motionmux/build_info_generated.h"

#include <string>

#include <expat.h>

namespace motionmux {
namespace {

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/MOTIONMUX_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/MOTIONMUX_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/MOTIONMUX_BUILDINFO_BUILD_TYPE,
        /*cmake_generator=*/MOTIONMUX_BUILDINFO_CMAKE_GENERATOR,
        /*system_name=*/MOTIONMUX_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/MOTIONMUX_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/MOTIONMUX_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/MOTIONMUX_BUILDINFO_CXX_COMPILER_VERSION,
        /*linkage_static=*/MOTIONMUX_BUILDINFO_LINKAGE_STATIC != 0,
        /*linkage_shared=*/MOTIONMUX_BUILDINFO_LINKAGE_SHARED != 0,
    };

    static const char* linkage_string(const BuildInfo& bi) noexcept
    {
        if (bi.linkage_static) {
            return "static";
        }
        if (bi.linkage_shared) {
            return "shared";
        }
        return "unknown";
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        const XML_Expat_Version expat = XML_ExpatVersionInfo();
        line1->clear();
        line1->append("MotionMux v");
        line1->append(bi.version);
        line1->append(" ");
        line1->append(bi.build_type);
        line1->append(" [expat ");
        line1->append(std::to_string(expat.major));
        line1->append(".");
        line1->append(std::to_string(expat.minor));
        line1->append(".");
        line1->append(std::to_string(expat.micro));
        line1->append("] ");
        line1->append(linkage_string(bi));
    }

    if (line2) {
        line2->clear();
        line2->append("built with ");
        line2->append(bi.cxx_compiler_id);
        line2->append("-");
        line2->append(bi.cxx_compiler_version);
        line2->append(" for ");
        line2->append(bi.system_name);
        line2->append("/");
        line2->append(bi.system_processor);
        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            line2->append(bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}

}  // namespace motionmux
