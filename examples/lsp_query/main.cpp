/// Query a language server about one position in a source file.
/// Usage: ./lsp_query <complete|hover|definition|references> <file> <line> <character> -- <server_command> [args...]
/// Example: WORKSPACE_ROOT=$PWD ./lsp_query hover src/main.zig 3 7 -- zls
///
/// The file is opened in the server with its current contents and the
/// result is printed as JSON. Line and character are zero-based.

#include <lspc/lspc.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {

std::string absolute_path(const std::string& path) {
    if (!path.empty() && path.front() == '/') return path;
    char cwd[4096];
    if (::getcwd(cwd, sizeof(cwd)) == nullptr) return path;
    return std::string(cwd) + "/" + path;
}

std::string language_for(const std::string& path) {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == path.size()) return "plaintext";
    std::string ext = path.substr(dot + 1);
    if (ext == "h" || ext == "hpp" || ext == "cc" || ext == "cpp") return "cpp";
    if (ext == "py") return "python";
    if (ext == "rs") return "rust";
    return ext;
}

int usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " <complete|hover|definition|references> <file> <line> <character>"
                 " -- <server_command> [args...]\n";
    return 1;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 7 || std::string(argv[5]) != "--") return usage(argv[0]);

    std::string op = argv[1];
    std::string path = absolute_path(argv[2]);
    lspc::Position pos;
    try {
        pos.line = std::stoll(argv[3]);
        pos.character = std::stoll(argv[4]);
    } catch (const std::exception&) {
        return usage(argv[0]);
    }

    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot read " << path << "\n";
        return 1;
    }
    std::stringstream contents;
    contents << in.rdbuf();

    const char* root_env = std::getenv("WORKSPACE_ROOT");
    std::string root = absolute_path(root_env ? root_env : ".");

    std::string command = argv[6];
    lspc::Session::Options opts;
    opts.command = command;
    for (int i = 7; i < argc; ++i) opts.args.emplace_back(argv[i]);
    opts.working_directory = root;
    lspc::Session session{std::move(opts)};

    try {
        session.start("file://" + root);
        std::cerr << "Connected to: " << session.server_info().value("name", command) << "\n";

        lspc::TextDocumentClient docs(session);
        std::string uri = "file://" + path;
        docs.did_open({uri, language_for(path), 1, contents.str()});

        nlohmann::json result;
        if (op == "complete") {
            result = docs.completion(uri, pos);
        } else if (op == "hover") {
            result = docs.hover(uri, pos);
        } else if (op == "definition") {
            result = docs.definition(uri, pos);
        } else if (op == "references") {
            result = docs.references(uri, pos);
        } else {
            session.stop();
            return usage(argv[0]);
        }
        std::cout << result.dump(2) << "\n";
        session.stop();
    } catch (const lspc::LspError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
