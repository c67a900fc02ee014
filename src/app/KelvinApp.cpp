/**
 * @file KelvinApp.cpp
 * @brief Implementation of the KelvinApp class.
 */
#include "app/KelvinApp.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include "application/TaskService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonTaskStore.hpp"
#include "infrastructure/PathUtils.hpp"
#include "ui/TaskPrinter.hpp"
#include "ui/TerminalStyle.hpp"

#ifndef KELVIN_VERSION
#define KELVIN_VERSION "0.1.0"
#endif

namespace kelvin::app {

namespace {

std::optional<std::string> ValueIfGiven(const CLI::Option* option, const std::string& value) {
    if (option->count() == 0) return std::nullopt;
    return value;
}

std::string Summary(const domain::Task& task) {
    return std::to_string(task.id) + " [" + domain::StateToString(task.state) + "]: " + task.title;
}

} // namespace

KelvinApp::KelvinApp(std::ostream& out, std::ostream& err, std::optional<domain::Date> today)
    : m_out(out), m_err(err), m_today(today) {}

int KelvinApp::Run(int argc, char** argv) {
    CLI::App cli{"Kelvin - A thermodynamic task manager", "kelvin"};
    cli.set_version_flag("-V,--version", std::string("kelvin ") + KELVIN_VERSION);
    cli.require_subcommand(1);
    cli.footer("Configuration is read from $XDG_CONFIG_HOME/kelvin/config.json "
               "(default ~/.config/kelvin/config.json). The file is JSON; config.toml is not read.");

    std::string title, description, thawSpec, dueSpec;
    std::uint32_t id = 0;
    bool showAll = false;
    bool showFrozen = false;

    auto* add = cli.add_subcommand("add", "Add a new task");
    add->add_option("title", title, "Task title")->required();
    auto* addDesc = add->add_option("--desc", description, "Task description");
    auto* addThaw = add->add_option("-d,--date", thawSpec,
        "Thaw date (e.g. 3d, 1w, 2026-03-01); the task starts Frozen");
    auto* addDue = add->add_option("--due", dueSpec, "Due date (e.g. 3d, 1w, 2026-03-01)");

    auto* edit = cli.add_subcommand("edit", "Edit an existing task");
    edit->add_option("id", id, "Task ID")->required();
    auto* editTitle = edit->add_option("-t,--title", title, "New title");
    auto* editDesc = edit->add_option("--desc", description, "New description");
    auto* editThaw = edit->add_option("-d,--date", thawSpec, "Change the thaw date");
    auto* editDue = edit->add_option("--due", dueSpec, "Change the due date");

    auto* show = cli.add_subcommand("show", "Show task details");
    show->add_option("id", id, "Task ID")->required();

    auto* list = cli.add_subcommand("list", "List tasks (Thawing and Active by default)");
    list->add_flag("--all", showAll, "Show all tasks");
    list->add_flag("--frozen", showFrozen, "Show only Frozen tasks");

    auto* warm = cli.add_subcommand("warm", "Make a task Active (Thawing/Frozen -> Active)");
    warm->add_option("id", id, "Task ID")->required();

    auto* burn = cli.add_subcommand("burn", "Complete a task (Active/Frozen -> Done)");
    burn->add_option("id", id, "Task ID")->required();

    auto* cool = cli.add_subcommand("cool", "Reopen a completed task (Done -> Active)");
    cool->add_option("id", id, "Task ID")->required();

    auto* freeze = cli.add_subcommand("freeze", "Defer a task (any state -> Frozen)");
    freeze->add_option("id", id, "Task ID")->required();
    auto* freezeThaw = freeze->add_option("-d,--date", thawSpec,
        "Thaw date (e.g. 3d, 1w, 2026-03-01); defaults to the configured thaw_days");

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli.exit(e, m_out, m_err);
    }

    try {
        const auto configDir = infrastructure::PathUtils::GetKelvinDir();
        const auto config = infrastructure::ConfigLoader::Load(configDir);
        auto store = std::make_shared<infrastructure::JsonTaskStore>(config.dataFilePath(configDir));
        application::TaskService service(store, config.thawDays);

        const domain::Date today = m_today ? *m_today : domain::Date::Today();
        const auto style = ui::TerminalStyle::ForStdout();

        if (add->parsed()) {
            application::AddTaskRequest request;
            request.title = title;
            request.description = ValueIfGiven(addDesc, description);
            request.thawSpec = ValueIfGiven(addThaw, thawSpec);
            request.dueSpec = ValueIfGiven(addDue, dueSpec);
            auto task = service.addTask(request, today);
            m_out << "Added task " << Summary(task) << std::endl;
        } else if (edit->parsed()) {
            application::EditTaskRequest request;
            request.id = id;
            request.title = ValueIfGiven(editTitle, title);
            request.description = ValueIfGiven(editDesc, description);
            request.thawSpec = ValueIfGiven(editThaw, thawSpec);
            request.dueSpec = ValueIfGiven(editDue, dueSpec);
            auto task = service.editTask(request, today);
            m_out << "Updated task " << Summary(task) << std::endl;
        } else if (show->parsed()) {
            ui::PrintTaskDetails(m_out, service.showTask(id, today), style);
        } else if (list->parsed()) {
            application::ListFilter filter = application::ListFilter::Open;
            if (showAll) {
                filter = application::ListFilter::All;
            } else if (showFrozen) {
                filter = application::ListFilter::Frozen;
            }
            ui::PrintTaskTable(m_out, service.listTasks(filter, today), style);
        } else if (warm->parsed()) {
            m_out << "Warmed task " << Summary(service.warmTask(id, today)) << std::endl;
        } else if (burn->parsed()) {
            m_out << "Burned task " << Summary(service.burnTask(id, today)) << std::endl;
        } else if (cool->parsed()) {
            m_out << "Cooled task " << Summary(service.coolTask(id, today)) << std::endl;
        } else if (freeze->parsed()) {
            auto task = service.freezeTask(id, ValueIfGiven(freezeThaw, thawSpec), today);
            m_out << "Froze task " << task.id << " [" << domain::StateToString(task.state) << "] until "
                  << ui::FormatDate(task.thawDate) << ": " << task.title << std::endl;
        }
    } catch (const std::exception& e) {
        m_err << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

} // namespace kelvin::app
