#include "filetree/app.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "filetree/cli.h"
#include "filetree/config.h"
#include "filetree/errors.h"
#include "filetree/logger.h"
#include "filetree/platform.h"
#include "filetree/tree_display.h"

namespace filetree {

class App::Impl {
public:
    ~Impl() {
        if (log_stream_) {
            Logger::instance().set_output(nullptr);
        }
    }

    int run(int argc, char** argv) {
        platform::prepare_console();
        auto& config = Config::instance();
        config.set_program_name(argc > 0 && argv ? std::filesystem::path{argv[0]}.filename().string() : "filetree");

        Cli cli;
        try {
            auto options = cli.parse(argc, argv);
            configure_logging(options);

            if (options.dump_markdown) {
                std::cout << cli.usage_markdown();
                return 0;
            }

            config.set_options(options);
            TreeDisplay display{config.options(), std::cout};
            display.display();
            return 0;
        } catch (const CLI::ParseError& ex) {
            return cli.exit(ex);
        } catch (const Error& ex) {
            Logger::instance().error("{}", ex.what());
            std::cerr << config.program_name() << ": error: " << ex.what() << '\n';
            return 1;
        }
    }

private:
    void configure_logging(const Config::Options& options) {
        auto& logger = Logger::instance();
        if (auto level = Logger::parse_level(options.log_level)) {
            logger.set_level(*level);
        }
        if (options.log_file) {
            log_stream_ = std::make_unique<std::ofstream>(*options.log_file, std::ios::app);
            if (*log_stream_) {
                logger.set_output(log_stream_.get());
            } else {
                std::cerr << "filetree: cannot open log file " << options.log_file->string() << '\n';
                log_stream_.reset();
            }
        }
    }

    std::unique_ptr<std::ofstream> log_stream_;
};

App::App()
    : impl_{std::make_unique<Impl>()} {}

App::~App() = default;

int App::run(int argc, char** argv) {
    return impl_->run(argc, argv);
}

} // namespace filetree
