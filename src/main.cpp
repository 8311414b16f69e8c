#include <cstdlib>
#include <iostream>
#include <list>
#include <string>
#include <vector>
#include "batch_processor.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [--password <pw>] <input.pdf> [output.json]\n";
    std::cerr << "       " << program << " [--password <pw>] --batch <input_dir> <output_dir>\n";
    std::cerr << "       " << program << " --serve <address> <port> <number_of_workers>\n";
    std::cerr << "  For IPv4, try:\n";
    std::cerr << "    " << program << " --serve 0.0.0.0 8080 100\n";
}

int run_server(const std::string& address_arg, const std::string& port_arg, const std::string& workers_arg) {
    auto const address = boost::asio::ip::make_address(address_arg);
    unsigned short port = static_cast<unsigned short>(std::stoi(port_arg));
    int num_workers = std::stoi(workers_arg);
    if (num_workers < 1) {
        std::cerr << "number_of_workers must be at least 1\n";
        return 2;
    }

    // assume that ioc is accessed from single thread
    boost::asio::io_context ioc{1};
    boost::asio::ip::tcp::acceptor acceptor{ioc, {address, port}};

    std::list<http_worker> workers;
    for (int i = 0; i < num_workers; ++i) {
        workers.emplace_back(acceptor);
        workers.back().start();
    }

    LOG_CHANNEL_INFO(LOG_CHANNEL_HTTP) << "Serving outlines on " << address_arg << ":" << port << " with " << num_workers << " workers";
    ioc.run();

    LOG_INFO << "Server stopped";
    return EXIT_SUCCESS;
}

int run_batch(const std::string& input_dir, const std::string& output_dir, const std::string& password) {
    Batch_Report report = process_pdf_directory(input_dir, output_dir, password);
    std::cerr << "Generated " << report.written.size() << " outline(s), " << report.failed.size() << " failed\n";
    for (const auto& failure : report.failed) {
        std::cerr << "  " << failure.first.string() << ": " << failure.second << "\n";
    }
    return report.failed.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
}

int run_single(const std::string& pdf_path, const std::string& output_path, const std::string& password) {
    if (!boost::filesystem::exists(pdf_path)) {
        std::cerr << "PDF not found: " << pdf_path << "\n";
        return 2;
    }

    std::optional<Outline_Document> outline = outline_pdf_file(pdf_path, password);
    if (!outline) {
        std::cerr << "Error: cannot read PDF document " << pdf_path << "\n";
        return EXIT_FAILURE;
    }

    if (output_path.empty()) {
        std::cout << format_outline_document(outline.value()) << std::endl;
        return EXIT_SUCCESS;
    }
    return write_outline_file(outline.value(), output_path) ? EXIT_SUCCESS : EXIT_FAILURE;
}

}

int main(int argc, char* argv[]) {
    try {
        std::string password;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--password" && i + 1 < argc) {
                password = argv[++i];
            } else if (arg.rfind("--password=", 0) == 0) {
                password = arg.substr(std::string("--password=").size());
            } else {
                args.push_back(arg);
            }
        }

        if (args.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        if (args[0] == "--serve") {
            if (args.size() != 4) {
                print_usage(argv[0]);
                return 2;
            }
            return run_server(args[1], args[2], args[3]);
        }

        if (args[0] == "--batch") {
            if (args.size() != 3) {
                print_usage(argv[0]);
                return 2;
            }
            return run_batch(args[1], args[2], password);
        }

        if (args.size() > 2 || args[0].rfind("--", 0) == 0) {
            print_usage(argv[0]);
            return 2;
        }
        return run_single(args[0], args.size() == 2 ? args[1] : std::string(), password);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
