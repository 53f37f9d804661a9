#include "attacher.hpp"
#include "../utils/log.hpp"

Attacher::Attacher(Loader& loader) : loader(loader) {}

error_t Attacher::attach(const std::vector<Program>& programs) {
    error_t err;

    for (auto it = programs.begin(); it != programs.end(); it++) {
        err = attach(*it);

        if (err) return err;
    }

    return 0;
}

error_t Attacher::attach(const Program& program) {
    if (modules.find(program.name) != modules.end()) {
        Log::error("Multiple programs with name ", program.name, ".\n");
        return DUPLICATE_PROGRAM;
    }

    std::unique_ptr<Module> module = loader.open(program);

    if (!module) {
        Log::error("Failed to compile module for program ", program.name, ".\n");
        return LOAD_FAILED;
    }

    int     fd;
    error_t err;

    for (auto it = program.kprobes.begin(); it != program.kprobes.end(); it++) {
        err = module->load_probe(it->second, &fd);

        if (err) {
            Log::error("Failed to load target ", it->second, " in program ", program.name, ": ", strerror(-err), ".\n");
            return PROBE_FAILED;
        }

        err = module->attach_kprobe(it->first, fd);

        if (err) {
            Log::error("Failed to attach kprobe ", it->first, " to ", it->second, " in program ", program.name, ": ",
                       strerror(-err), ".\n");
            return ATTACH_FAILED;
        }

        Log::success("Attach kprobe ", it->first, " of program ", program.name, ".\n");
    }

    for (auto it = program.kretprobes.begin(); it != program.kretprobes.end(); it++) {
        err = module->load_probe(it->second, &fd);

        if (err) {
            Log::error("Failed to load target ", it->second, " in program ", program.name, ": ", strerror(-err), ".\n");
            return PROBE_FAILED;
        }

        err = module->attach_kretprobe(it->first, fd);

        if (err) {
            Log::error("Failed to attach kretprobe ", it->first, " to ", it->second, " in program ", program.name, ": ",
                       strerror(-err), ".\n");
            return ATTACH_FAILED;
        }

        Log::success("Attach kretprobe ", it->first, " of program ", program.name, ".\n");
    }

    modules[program.name] = std::move(module);

    return 0;
}

const Module* Attacher::module(const std::string& name) const {
    auto found = modules.find(name);

    return found == modules.end() ? nullptr : found->second.get();
}
