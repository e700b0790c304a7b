/*
 * Pipeline executor implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/pipeline.hpp>
#include <shellkit/core/log.hpp>
#include <sstream>

namespace shellkit {

Error cancelled_error(const Context& ctx) {
    std::string why = ctx.reason();
    return make_error(ErrorKind::Cancelled, "command cancelled: " + (why.empty() ? std::string("cancelled") : why));
}

PipelineExecutor::PipelineExecutor(const Dispatcher& dispatcher, FileHandler& files)
    : m_dispatcher(dispatcher), m_files(&files) {}

ExecResult PipelineExecutor::run_chain(const Context& ctx, const Chain& chain, VariableStore* scope) const {
    ExecResult res;
    std::string carried;
    bool have_input = false;
    for (const ParsedCommand* stage = chain.head.get(); stage; stage = stage->next.get()) {
        if (ctx.cancelled()) { res.output = carried; res.error = cancelled_error(ctx); return res; }
        std::vector<std::string> argv = stage->argv();
        if (m_expand_arg) {
            for (auto& a : argv) {
                Expansion e = m_expand_arg(a, scope);
                if (e.error) { res.error = e.error; return res; }
                a = std::move(e.text);
            }
        }
        std::ostringstream out;
        Status st = m_dispatcher.invoke(argv, have_input ? &carried : nullptr, out, ctx, scope);
        if (st) { res.output = out.str(); res.error = st; return res; }
        carried = out.str();
        have_input = true;
    }
    res.output = std::move(carried);
    if (!chain.redirect.empty()) {
        if (!m_files) {
            res.error = make_error(ErrorKind::Io, "failed to write to file " + chain.redirect + ": no file handler");
            return res;
        }
        res.error = m_files->write_file(chain.redirect, res.output, chain.append ? RedirType::OutAppend : RedirType::Out);
    }
    return res;
}

ExecResult PipelineExecutor::run(const Context& ctx, const ParseResult& parsed, VariableStore* scope,
                                 const ChainSink& sink) const {
    ExecResult res;
    if (parsed.error) { res.error = parsed.error; return res; }
    for (auto& chain : parsed.chains) {
        if (ctx.cancelled()) { res.error = cancelled_error(ctx); return res; }
        if (chain.background && m_launch) {
            int id = m_launch(chain, scope);
            Chain fg = chain.clone(); fg.background = false;
            std::string line = "[" + std::to_string(id) + "] " + fg.to_string() + "\n";
            res.output += line;
            if (sink) sink(line);
            continue;
        }
        ExecResult r = run_chain(ctx, chain, scope);
        res.output += r.output;
        if (r.error) {
            log_debug("chain '" + chain.to_string() + "' failed: " + r.error->message);
            res.error = r.error;
            return res;
        }
        if (sink) sink(r.output);
    }
    return res;
}

} // namespace shellkit
