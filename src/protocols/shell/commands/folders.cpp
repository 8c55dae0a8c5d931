#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/util/argsHelpers.hpp"
#include "protocols/shell/util/lineHelpers.hpp"
#include "engine/Engine.hpp"
#include "config/Config.hpp"

#include <fmt/core.h>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace fw::engine;
using namespace fw::fs::model;
using namespace fw::plan::model;
using namespace fw::classify::model;

namespace fw::protocols::shell {

namespace {

const std::vector<std::string> RECURSIVE_FLAGS{"recursive", "r"};

template <typename T, typename Human>
CommandResult render(const CommandCall& call, const Outcome<T>& outcome, Human&& human, const bool failed = false) {
    if (!outcome) {
        const auto& err = outcome.error();
        if (hasFlag(call, "json")) return {1, nlohmann::json(err).dump(2) + "\n", ""};
        return {1, "", fmt::format("{}: {}\n", to_string(err.type), err.message)};
    }

    auto r = hasFlag(call, "json") ? okJson(outcome.value()) : ok(human(outcome.value()));
    if (failed) r.exit_code = 1;
    return r;
}

OptPath folderArg(const CommandCall& call, const std::size_t index) {
    if (call.positionals.size() <= index) return std::nullopt;
    return config::expandUser(call.positionals[index]);
}

std::optional<CommandResult> rejectExtra(const CommandCall& call, const std::size_t maxPositionals,
                                         const std::vector<std::string>& allowedFlags) {
    if (const auto flag = unknownFlag(call, allowedFlags)) return invalid(fmt::format("Unknown option --{} for {}", *flag, call.name));
    if (call.positionals.size() > maxPositionals) return invalid(fmt::format("Too many arguments for {}", call.name));
    return std::nullopt;
}

std::string dryRunNote(const bool dryRun) {
    return dryRun ? "\nDry run: nothing was changed. Re-run with --commit to apply.\n" : "";
}

std::string renderExecution(const PlanExecutionResult& r, const std::string& verb) {
    std::string out;

    if (!r.applied.empty()) {
        Table t({{"FROM", Align::Left, 4, 48, true}, {"TO", Align::Left, 2, 64, true}}, term_width());
        for (const auto& a : r.applied) t.add_row({a.current_name, a.proposed_name});
        out += fmt::format("{} ({}):\n", r.dry_run ? "Would " + verb : "Done", r.applied.size());
        out += t.render();
    }

    if (!r.skipped.empty()) {
        Table t({{"NAME", Align::Left, 4, 48, true}, {"REASON", Align::Left, 6}}, term_width());
        for (const auto& s : r.skipped) t.add_row({s.name, s.reason});
        out += fmt::format("Skipped ({}):\n", r.skipped.size());
        out += t.render();
    }

    if (!r.errors.empty()) {
        Table t({{"NAME", Align::Left, 4, 48, true}, {"KIND", Align::Left, 4}, {"ERROR", Align::Left, 5}}, term_width());
        for (const auto& e : r.errors) t.add_row({e.current_name, to_string(e.kind), e.message});
        out += fmt::format("Errors ({}):\n", r.errors.size());
        out += t.render();
    }

    out += fmt::format("{}: {} applied, {} skipped, {} errors in {}\n",
                       to_string(r.state), r.applied.size(), r.skipped.size(), r.errors.size(), r.folder.string());
    return out + dryRunNote(r.dry_run);
}

CommandResult handle_list(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {})) return *bad;

    return render(call, call.engine->list(folderArg(call, 0)), [](const ListResult& l) {
        Table t({
            {"NAME", Align::Left, 4, 64, true},
            {"TYPE", Align::Left, 4},
            {"SIZE", Align::Right, 4},
            {"MODIFIED", Align::Left, 8}
        }, term_width());

        for (const auto& e : l.items)
            t.add_row({e.name, to_string(e.kind), e.size_bytes ? human_bytes(*e.size_bytes) : "-", short_time(e.modified_at)});

        std::string out = t.render();
        out += fmt::format("{} items in {}", l.totalCount(), l.folder.string());
        if (l.skipped) out += fmt::format(" ({} skipped)", l.skipped);
        return out + "\n";
    });
}

CommandResult handle_check(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {})) return *bad;
    if (call.positionals.empty()) return invalid("check requires a PATH");

    const auto outcome = call.engine->checkSandbox(config::expandUser(call.positionals[0]));
    const bool unsafe = outcome && !outcome.value().is_safe;
    return render(call, outcome, [](const sandbox::Check& c) {
        return fmt::format("{}: {}\n", c.is_safe ? "allowed" : "denied", c.message);
    }, unsafe);
}

CommandResult handle_dupes(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {"recursive", "r"})) return *bad;

    const bool recursive = hasFlag(call, RECURSIVE_FLAGS);
    return render(call, call.engine->findDuplicates(folderArg(call, 0), recursive, call.cancel), [](const DuplicatesResult& d) {
        std::string out;
        for (const auto& g : d.groups) {
            out += fmt::format("{}  {} x {}  wasted {}\n", g.content_hash.substr(0, 16), g.count(),
                               human_bytes(g.representative_size), human_bytes(g.wasted_bytes));
            for (const auto& m : g.members) out += fmt::format("    {}\n", m.relative_path.string());
        }
        if (!d.unreadable.empty()) {
            out += fmt::format("Unreadable ({}):\n", d.unreadable.size());
            for (const auto& u : d.unreadable) out += fmt::format("    {}: {}\n", u.relative_path.string(), u.reason);
        }
        out += fmt::format("{} files scanned, {} duplicate groups, {} duplicate files, {} reclaimable{}\n",
                           d.files_scanned, d.groups.size(), d.totalDuplicateFiles(),
                           human_bytes(d.totalWastedBytes()), d.cancelled ? " (cancelled)" : "");
        return out;
    });
}

CommandResult handle_plan(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {})) return *bad;

    return render(call, call.engine->planAlpha(folderArg(call, 0)), [](const PlanResult& p) {
        Table t({
            {"CURRENT", Align::Left, 7, 48, true},
            {"PROPOSED", Align::Left, 8, 48, true},
            {"TYPE", Align::Left, 4},
            {"CHANGE", Align::Left, 6}
        }, term_width());

        for (const auto& i : p.items)
            t.add_row({i.current_name, i.proposed_name, fs::model::to_string(i.kind), i.needs_change ? "yes" : "no"});

        return t.render() + fmt::format("{} of {} items need a change in {}\n",
                                        p.changesCount(), p.items.size(), p.folder.string());
    });
}

CommandResult handle_apply(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {"plan", "commit"})) return *bad;

    const auto folder = folderArg(call, 0);
    const bool dryRun = !hasFlag(call, "commit");

    std::vector<RenameItem> items;
    if (const auto planFile = optVal(call, "plan")) {
        if (planFile->empty()) return invalid("--plan requires a FILE");
        std::ifstream in(config::expandUser(*planFile));
        if (!in) return invalid("Cannot read plan file: " + *planFile);

        const auto doc = nlohmann::json::parse(in, nullptr, false);
        if (doc.is_discarded()) return invalid("Plan file is not valid JSON: " + *planFile);

        try {
            const auto& arr = doc.is_object() && doc.contains("plan") ? doc.at("plan") : doc;
            items = arr.get<std::vector<RenameItem>>();
        } catch (const nlohmann::json::exception& e) {
            return invalid(fmt::format("Malformed plan in {}: {}", *planFile, e.what()));
        } catch (const EngineError& e) {
            return invalid(fmt::format("Malformed plan in {}: {}", *planFile, e.what()));
        }
    } else {
        const auto plan = call.engine->planAlpha(folder);
        if (!plan) return render(call, plan, [](const PlanResult&) { return std::string{}; });
        items = plan.value().items;
    }

    const auto outcome = call.engine->applyPlan(items, folder, dryRun);
    const bool failed = outcome && !outcome.value().success();
    return render(call, outcome, [](const PlanExecutionResult& r) { return renderExecution(r, "rename"); }, failed);
}

CommandResult handle_organize(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 1, {"commit"})) return *bad;

    const auto outcome = call.engine->organizeByType(folderArg(call, 0), !hasFlag(call, "commit"));
    const bool failed = outcome && !outcome.value().success();
    return render(call, outcome, [](const OrganizeByTypeResult& r) {
        std::string out = renderExecution(r, "move");
        if (!r.created_folders.empty()) {
            out += r.dry_run ? "Folders to create:\n" : "Folders created:\n";
            for (const auto& f : r.created_folders) out += fmt::format("    {}\n", f.string());
        }
        return out;
    }, failed);
}

CommandResult handle_categorize(const CommandCall& call) {
    if (auto bad = rejectExtra(call, 3, {"copy", "recursive", "r", "commit"})) return *bad;
    if (call.positionals.size() < 2) return invalid("categorize requires CATEGORY and TARGET");

    classify::CategoryOptions opts;
    opts.copy = hasFlag(call, "copy");
    opts.recursive = hasFlag(call, RECURSIVE_FLAGS);
    opts.dry_run = !hasFlag(call, "commit");

    const auto outcome = call.engine->organizeByCategory(call.positionals[0], config::expandUser(call.positionals[1]),
                                                         folderArg(call, 2), opts);
    const bool failed = outcome && !outcome.value().success();
    return render(call, outcome, [](const CategoryOrganizeResult& r) {
        std::string out;

        Table t({
            {"FILE", Align::Left, 4, 48, true},
            {"RESULT", Align::Left, 6},
            {"REASON", Align::Left, 6}
        }, term_width());

        for (const auto& m : r.moved)
            t.add_row({m.file, m.renamed ? "renamed" : m.replaced ? "replaced" : r.copy ? "copied" : "moved", m.destination.string()});
        for (const auto& s : r.skipped) t.add_row({s.name, "skipped", s.reason});
        for (const auto& e : r.errors) t.add_row({e.current_name, "error", e.message});

        if (!t.empty()) out += t.render();
        out += fmt::format("'{}': {} of {} files {} to {}\n", r.category, r.moved.size(), r.total_evaluated,
                           r.copy ? "copied" : "moved", r.target_folder.string());
        return out + dryRunNote(r.dry_run);
    }, failed);
}

}

void registerFolderCommands(Router& r) {
    r.registerCommand("list", {"list [PATH]", "List a folder (read-only)", handle_list, true, {"ls"}});
    r.registerCommand("check", {"check PATH", "Tell whether a path is inside the allowed roots", handle_check, true, {}});
    r.registerCommand("dupes", {"dupes [PATH] [--recursive]", "Find files with identical content", handle_dupes, true, {"duplicates"}});
    r.registerCommand("plan", {"plan [PATH]", "Propose normalized names", handle_plan, true, {}});
    r.registerCommand("apply", {"apply [PATH] [--plan FILE] [--commit]", "Apply a rename plan", handle_apply, true, {}});
    r.registerCommand("organize", {"organize [PATH] [--commit]", "Move files into per-extension folders", handle_organize, true, {}});
    r.registerCommand("categorize", {"categorize CATEGORY TARGET [PATH] [--copy] [--recursive] [--commit]",
                                     "Gather files of a category into TARGET", handle_categorize, true, {}});
}

}
