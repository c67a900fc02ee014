#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "application/TaskService.hpp"
#include "domain/Errors.hpp"

using namespace kelvin::domain;
using namespace kelvin::application;

// In-memory repository that records how often the service saved.
class MockTaskRepository : public TaskRepository {
public:
    std::vector<Task> load() override {
        ++loads;
        return stored;
    }

    void save(const std::vector<Task>& tasks) override {
        ++saves;
        stored = tasks;
    }

    std::vector<Task> stored;
    int loads = 0;
    int saves = 0;
};

namespace {

Date D(int y, unsigned m, unsigned d) {
    return *Date::FromYmd(y, m, d);
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

AddTaskRequest Add(const std::string& title) {
    AddTaskRequest request;
    request.title = title;
    return request;
}

} // namespace

static void TestScenario() {
    auto repo = std::make_shared<MockTaskRepository>();
    TaskService service(repo, 7);

    // Plain add -> Active, no thaw date
    Task plain = service.addTask(Add("Write report"), D(2026, 1, 1));
    assert(plain.id == 1);
    assert(plain.state == TaskState::Active);
    assert(!plain.thawDate);
    assert(plain.createdAt == D(2026, 1, 1));

    // Add with "7d" -> Frozen until 2026-01-08
    AddTaskRequest deferred = Add("Renew passport");
    deferred.thawSpec = "7d";
    Task frozen = service.addTask(deferred, D(2026, 1, 1));
    assert(frozen.id == 2);
    assert(frozen.state == TaskState::Frozen);
    assert(frozen.thawDate == D(2026, 1, 8));

    // Not yet thawed the day before
    assert(service.showTask(2, D(2026, 1, 7)).state == TaskState::Frozen);

    // Sweep on the thaw date -> Thawing (date kept)
    Task thawing = service.showTask(2, D(2026, 1, 8));
    assert(thawing.state == TaskState::Thawing);
    assert(thawing.thawDate == D(2026, 1, 8));
    assert(repo->stored[1].state == TaskState::Thawing);

    Task active = service.warmTask(2, D(2026, 1, 8));
    assert(active.state == TaskState::Active);
    assert(!active.thawDate);

    assert(service.burnTask(2, D(2026, 1, 9)).state == TaskState::Done);
    assert(service.coolTask(2, D(2026, 1, 10)).state == TaskState::Active);

    // Freeze without spec uses the default defer period
    Task refrozen = service.freezeTask(2, std::nullopt, D(2026, 2, 1));
    assert(refrozen.state == TaskState::Frozen);
    assert(refrozen.thawDate == D(2026, 2, 8));

    // Freeze with an explicit spec
    Task snoozed = service.freezeTask(1, std::string("2w"), D(2026, 2, 1));
    assert(snoozed.thawDate == D(2026, 2, 15));

    // created_at never changes
    assert(repo->stored[1].createdAt == D(2026, 1, 1));
    std::cout << "[PASS] Lifecycle scenario." << std::endl;
}

static void TestListFiltersAndSaves() {
    auto repo = std::make_shared<MockTaskRepository>();
    TaskService service(repo, 7);
    const Date today = D(2026, 3, 1);

    service.addTask(Add("active"), today);
    AddTaskRequest later = Add("frozen");
    later.thawSpec = "2026-03-05";
    service.addTask(later, today);
    service.addTask(Add("done"), today);
    service.burnTask(3, today);

    const int savesBefore = repo->saves;
    auto open = service.listTasks(ListFilter::Open, today);
    assert(open.size() == 1 && open[0].title == "active");
    assert(repo->saves == savesBefore); // nothing thawed -> no save

    auto frozen = service.listTasks(ListFilter::Frozen, today);
    assert(frozen.size() == 1 && frozen[0].title == "frozen");

    auto all = service.listTasks(ListFilter::All, today);
    assert(all.size() == 3);
    assert(all[0].id == 1 && all[1].id == 2 && all[2].id == 3); // insertion order

    // Thaw day arrives: list persists the sweep
    auto thawed = service.listTasks(ListFilter::Open, D(2026, 3, 5));
    assert(thawed.size() == 2);
    assert(thawed[1].state == TaskState::Thawing);
    assert(repo->saves == savesBefore + 1);
    assert(repo->stored[1].state == TaskState::Thawing);

    // Second list on the same day: sweep is idempotent, no save
    service.listTasks(ListFilter::Open, D(2026, 3, 5));
    assert(repo->saves == savesBefore + 1);
    std::cout << "[PASS] List filters and conditional save." << std::endl;
}

static void TestErrorsLeaveStoreUntouched() {
    auto repo = std::make_shared<MockTaskRepository>();
    TaskService service(repo, 7);
    const Date today = D(2026, 1, 1);

    AddTaskRequest deferred = Add("deferred");
    deferred.thawSpec = "1d";
    service.addTask(deferred, today);
    service.addTask(Add("active"), today);
    const auto snapshot = repo->stored;
    const int saves = repo->saves;

    // Even though the sweep would thaw task 1 on 01-02, a failing command saves nothing.
    const Date tomorrow = D(2026, 1, 2);
    assert(Throws<TaskNotFound>([&] { service.warmTask(99, tomorrow); }));
    assert(Throws<TaskNotFound>([&] { service.showTask(99, tomorrow); }));
    assert(Throws<InvalidTransition>([&] { service.warmTask(2, tomorrow); }));
    assert(Throws<InvalidTransition>([&] { service.coolTask(2, tomorrow); }));
    assert(Throws<InvalidTransition>([&] { service.burnTask(1, tomorrow); })); // Thawing cannot burn
    assert(Throws<InvalidDateSpec>([&] { service.freezeTask(2, std::string("3x"), tomorrow); }));

    EditTaskRequest badEdit;
    badEdit.id = 2;
    badEdit.title = "renamed";
    badEdit.dueSpec = "soon";
    assert(Throws<InvalidDateSpec>([&] { service.editTask(badEdit, tomorrow); }));

    AddTaskRequest badAdd = Add("bad");
    badAdd.thawSpec = "-1d";
    assert(Throws<InvalidDateSpec>([&] { service.addTask(badAdd, tomorrow); }));
    assert(Throws<std::invalid_argument>([&] { service.addTask(Add(""), tomorrow); }));

    assert(repo->saves == saves);
    assert(repo->stored.size() == snapshot.size());
    assert(repo->stored[0].state == TaskState::Frozen);
    assert(repo->stored[1].title == "active");

    // Default defer overflow near the end of the calendar
    auto edgeRepo = std::make_shared<MockTaskRepository>();
    TaskService edge(edgeRepo, 7);
    edge.addTask(Add("edge"), D(9999, 12, 30));
    assert(Throws<InvalidDateSpec>([&] { edge.freezeTask(1, std::nullopt, D(9999, 12, 30)); }));
    std::cout << "[PASS] Failed commands do not persist." << std::endl;
}

static void TestEdit() {
    auto repo = std::make_shared<MockTaskRepository>();
    TaskService service(repo, 7);
    const Date today = D(2026, 1, 1);

    AddTaskRequest request = Add("Old title");
    request.description = "desc";
    request.dueSpec = "1w";
    Task created = service.addTask(request, today);
    assert(created.dueDate == D(2026, 1, 8));
    assert(created.description == "desc");

    EditTaskRequest edit;
    edit.id = 1;
    edit.title = "New title";
    Task edited = service.editTask(edit, today);
    assert(edited.title == "New title");
    assert(edited.description == "desc");
    assert(edited.dueDate == D(2026, 1, 8));
    assert(edited.state == TaskState::Active);

    EditTaskRequest dates;
    dates.id = 1;
    dates.thawSpec = "2026-05-01";
    dates.dueSpec = "2026-06-01";
    dates.description = "";
    Task redated = service.editTask(dates, today);
    assert(redated.thawDate == D(2026, 5, 1));
    assert(redated.dueDate == D(2026, 6, 1));
    assert(redated.description.empty());
    assert(redated.state == TaskState::Active); // edit never changes state
    assert(redated.createdAt == today);

    EditTaskRequest emptyTitle;
    emptyTitle.id = 1;
    emptyTitle.title = "";
    assert(Throws<std::invalid_argument>([&] { service.editTask(emptyTitle, today); }));
    std::cout << "[PASS] Edit." << std::endl;
}

static void TestIdsNeverReused() {
    auto repo = std::make_shared<MockTaskRepository>();
    Task three(3, "three", D(2026, 1, 1));
    Task five(5, "five", D(2026, 1, 1));
    repo->stored = {three, five};

    TaskService service(repo, 7);
    Task added = service.addTask(Add("next"), D(2026, 1, 1));
    assert(added.id == 6);
    std::cout << "[PASS] Id assignment." << std::endl;
}

int main() {
    std::cout << "[Test] Starting TaskService Test..." << std::endl;
    TestScenario();
    TestListFiltersAndSaves();
    TestErrorsLeaveStoreUntouched();
    TestEdit();
    TestIdsNeverReused();
    std::cout << "[PASS] TaskService Test." << std::endl;
    return 0;
}
