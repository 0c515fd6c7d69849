/**
 * @file main.cpp
 * @brief keyforge command-line host
 *
 * Reads parameters, runs the pipeline once and writes the finished solid.
 */

#include "HostParameters.h"

#include "keyforge/MeshExport.h"
#include "pipeline/KeyforgePipeline.h"

#include <cstdio>

using namespace keyforge;

int main(int argc, char** argv) {
    HostParameters::Settings settings;
    try {
        settings = HostParameters::parseCommandLine(argc, argv);
    } catch (const HostParameters::ConfigError& e) {
        KEYFORGE_LOG_ERROR("%s", e.what());
        HostParameters::printUsage(stderr, argv[0]);
        return 2;
    }

    if (settings.show_help) {
        HostParameters::printUsage(stdout, argv[0]);
        return 0;
    }

    PipelineResult result = runPipeline(settings.spec, settings.config);
    result.diagnostics.print();

    if (settings.print_timing) {
        result.printTiming();
    }

    if (!result.hasOutput()) {
        KEYFORGE_LOG_ERROR("Generation failed: %s", result.error_message.c_str());
        return 1;
    }

    bool written = false;
    switch (settings.format) {
        case HostParameters::OutputFormat::Obj:
            written = writeObj(result.output, result.material, settings.output);
            break;
        case HostParameters::OutputFormat::Stl:
            written = writeStlBinary(result.output, settings.output);
            break;
    }

    if (!written) {
        KEYFORGE_LOG_ERROR("Export to %s failed", HostParameters::formatName(settings.format));
        return 1;
    }

    return 0;
}
