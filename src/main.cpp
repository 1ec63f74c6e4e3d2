#include "tabexport/TabExport.hpp"
#include "tabexport/core/ExportOptions.hpp"
#include "tabexport/core/Exception.hpp"
#include "tabexport/db/SqliteExecutor.hpp"
#include "tabexport/session/ExportEngine.hpp"
#include "tabexport/session/StatementLoop.hpp"
#include <getopt.h>
#include <fstream>
#include <iostream>

namespace {

enum ExitCode {
    kExitOk = 0,
    kExitUsage = 1,
    kExitDatabase = 2,
    kExitRuntime = 3,
    kExitClose = 4
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <database>\n"
              << "  -f text|csv|html|xls  output format (default text)\n"
              << "  -o file               output file (required for xls, stdout otherwise)\n"
              << "  -t title              document title\n"
              << "  -T tabs               sheet configuration: [name|title][name2]...\n"
              << "  -s css                stylesheet for html output\n"
              << "  -S sheet              write every result set to this sheet\n"
              << "  -a                    append to an existing workbook\n"
              << "  -i                    keep the result set counter across statements\n"
              << "  -h                    no column headings\n"
              << "  -r                    results only (no update counts)\n"
              << "  -q                    quiet: no prompt, warnings only\n"
              << "  -u user               user name (unused by sqlite)\n"
              << "  -p password           password (unused by sqlite)\n"
              << "  -l logfile            write log to file\n"
              << "  -v                    verbose logging\n"
              << "database: file.db | sqlite:file.db | jdbc:sqlite:file.db | :memory:\n";
}

} // namespace

int main(int argc, char* argv[]) {
    tabexport::core::ExportOptions options;
    std::string log_file;
    bool verbose = false;
    
    int c;
    while ((c = getopt(argc, argv, "f:o:t:T:s:S:aihrqu:p:l:v")) != -1) {
        switch (c) {
            case 'f': {
                auto format = tabexport::core::parseOutputFormat(optarg);
                if (format) {
                    options.format = *format;
                } else {
                    std::cerr << "Unknown output format '" << optarg << "', using text\n";
                }
                break;
            }
            case 'o':
                options.output_file = optarg;
                break;
            case 't':
                options.title = tabexport::core::normalizeTitle(optarg);
                break;
            case 'T':
                options.tabs = tabexport::core::parseTabSpec(optarg);
                break;
            case 's':
                options.css_file = optarg;
                break;
            case 'S':
                options.pinned_sheet = std::string(optarg);
                break;
            case 'a':
                options.append = true;
                break;
            case 'i':
                options.increment_tab = true;
                break;
            case 'h':
                options.headings = false;
                break;
            case 'r':
                options.results_only = true;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'u':
            case 'p':
                // sqlite 不需要认证
                break;
            case 'l':
                log_file = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                printUsage(argv[0]);
                return kExitUsage;
        }
    }
    
    if (optind >= argc) {
        std::cerr << "Missing database\n";
        printUsage(argv[0]);
        return kExitUsage;
    }
    if (options.format == tabexport::core::OutputFormat::Xls && !options.output_file) {
        std::cerr << "Workbook output requires -o <file>\n";
        return kExitUsage;
    }
    const std::string url = argv[optind];
    
    auto level = tabexport::Logger::Level::INFO;
    if (verbose) {
        level = tabexport::Logger::Level::DEBUG;
    } else if (options.quiet) {
        level = tabexport::Logger::Level::WARN;
    }
    tabexport::initialize(log_file, level, true);
    
    std::unique_ptr<tabexport::db::SqliteExecutor> executor;
    try {
        executor = std::make_unique<tabexport::db::SqliteExecutor>(url);
    } catch (const tabexport::core::DatabaseException& e) {
        TABEXPORT_LOG_ERROR("Error: {}", e.what());
        tabexport::cleanup();
        return kExitDatabase;
    }
    
    int exit_code = kExitOk;
    try {
        std::ofstream file_out;
        std::ostream* out = &std::cout;
        if (options.format != tabexport::core::OutputFormat::Xls && options.output_file) {
            file_out.open(*options.output_file, std::ios::out | std::ios::trunc);
            if (!file_out) {
                throw tabexport::core::FileException("Cannot open output file", *options.output_file,
                                                     tabexport::core::ErrorCode::FileAccessDenied,
                                                     __FILE__, __LINE__);
            }
            out = &file_out;
        }
        
        tabexport::session::ExportEngine engine(options, *executor, *out);
        tabexport::session::StatementLoop loop(engine, std::cin, std::cerr, url, options.quiet);
        loop.run();
        
        out->flush();
        if (!*out) {
            throw tabexport::core::FileException("Failed to write output", options.output_file.value_or("<stdout>"),
                                                 tabexport::core::ErrorCode::FileWriteError,
                                                 __FILE__, __LINE__);
        }
    } catch (const tabexport::core::TabExportException& e) {
        TABEXPORT_LOG_CRITICAL("Fatal: {}", e.what());
        exit_code = kExitRuntime;
    }
    
    try {
        executor->close();
    } catch (const tabexport::core::DatabaseException& e) {
        TABEXPORT_LOG_ERROR("Error: {}", e.what());
        if (exit_code == kExitOk) {
            exit_code = kExitClose;
        }
    }
    
    tabexport::cleanup();
    return exit_code;
}
