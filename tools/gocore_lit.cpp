// gocore_lit - evaluate a literal program and print each (print ...) line
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <exception>
#include "gocore/diagnostics_json.hpp"
#include "gocore/env.hpp"
#include "gocore/literal_reader.hpp"
#include "gocore/panic.hpp"

#include <llvm/Support/ErrorHandling.h>
#include <llvm/Support/PrettyStackTrace.h>
#include <llvm/Support/Signals.h>
#include <llvm/Support/raw_ostream.h>

using namespace gocore;

static void gocoreFatalHandler(void *userData, const char *reason, bool genCrashDiag) {
    (void)userData; (void)genCrashDiag;
    fprintf(stderr, "[fatal][llvm] %s\n", reason ? reason : "<null reason>");
    llvm::sys::PrintStackTrace(llvm::errs());
    fprintf(stderr, "[fatal][llvm] end stack trace\n");
}

static void installFatalHandler(){
    llvm::install_fatal_error_handler(gocoreFatalHandler);
    llvm::EnablePrettyStackTrace();
    llvm::sys::AddSignalHandler([](void*){
        fprintf(stderr, "[fatal][signal] caught fatal signal, printing stack trace...\n");
        llvm::sys::PrintStackTrace(llvm::errs());
        fprintf(stderr, "[fatal][signal] end stack trace\n");
    }, nullptr);
    fprintf(stderr, "[diag] Installed LLVM fatal error handler (GOCORE_INSTALL_FATAL_HANDLER=1)\n");
}

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path);
    if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf();
    out = ss.str();
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: gocore_lit <program.edn>\n"; return 1; }
    if(runtimeEnv().installFatalHandler) installFatalHandler();
    std::string src;
    if(!read_file(argv[1], src)){ std::cerr << "failed to read " << argv[1] << "\n"; return 1; }

    TypeContext ctx;
    std::string output;
    llvm::raw_string_ostream os(output);
    int status = 0;
    try {
        run_program(ctx, edn::parse(src), os);
    } catch(const runtime_panic& p){
        std::cerr << "panic: " << p.what() << " [" << p.code << "]\n";
        if(!p.hint.empty()) std::cerr << "  hint: " << p.hint << "\n";
        maybe_print_json(p);
        status = 2;
    } catch(const edn::parse_error& e){
        std::cerr << "error: " << e.what() << "\n";
        status = 1;
    } catch(const type_error& e){
        std::cerr << "error: " << e.what() << "\n";
        status = 1;
    } catch(const std::exception& e){
        std::cerr << "error: " << e.what() << "\n";
        status = 1;
    }
    // lines printed before a panic are still program output
    std::cout << os.str();
    return status;
}
