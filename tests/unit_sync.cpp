#include "../libflashsync/include/flashsync.hpp"
#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <mutex>
#include <vector>

using namespace flashsync;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string &name){
    fs::path p = fs::path("unit_tmp")/name;
    fs::remove_all(p); fs::create_directories(p); return p;
}
static void write_file(const fs::path &p, std::string_view data){ fs::create_directories(p.parent_path()); std::ofstream o(p, std::ios::binary); o<<data; }
static std::string read_file(const fs::path &p){ std::ifstream i(p, std::ios::binary); return std::string((std::istreambuf_iterator<char>(i)),{}); }

static SyncRequest make_request(const fs::path& src, const fs::path& dst, std::string patterns = ".*"){
    SyncRequest r;
    r.origin = src.string();
    r.destination = dst.string();
    r.patterns = std::move(patterns);
    return r;
}

template<class Ex, class F>
static bool throws(F&& f){
    try { f(); } catch (const Ex&) { return true; }
    return false;
}

static void test_three_file_scenario(){
    auto base = make_temp_dir("sync_three");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"a.txt","alpha");
    write_file(src/"b.txt","bravo v2");
    write_file(src/"c.txt","charlie source");
    write_file(src/"d.jpg","not matched");
    write_file(dst/"b.txt","bravo v1");
    write_file(dst/"c.txt","charlie dest");

    const auto b_time = fs::last_write_time(src/"b.txt");
    fs::last_write_time(dst/"b.txt", b_time - std::chrono::hours(2));
    fs::last_write_time(dst/"c.txt", fs::last_write_time(src/"c.txt"));

    Synchronizer sync(4);
    auto result = sync.synchronize(make_request(src,dst,".*\\.txt"));
    assert(result.total_files==3);
    assert(result.files_created==1);
    assert(result.files_updated==1);
    assert(result.files_skipped==1);
    assert(result.files_failed==0);
    assert(result.is_success());
    assert(result.files_modified()==2);
    assert(result.errors.empty());
    assert(!result.dry_run);

    assert(read_file(dst/"a.txt")=="alpha");
    assert(read_file(dst/"b.txt")=="bravo v2");
    assert(read_file(dst/"c.txt")=="charlie dest");
    assert(!fs::exists(dst/"d.jpg"));
    assert(result.to_string()=="Sync completed: 3 total, 1 created, 1 updated, 1 skipped, 0 failed");
}

static void test_empty_source(){
    auto base = make_temp_dir("sync_empty");
    auto src = base/"src"; auto dst = base/"dst";
    fs::create_directories(src);

    std::vector<SyncProgress> events;
    Synchronizer sync;
    auto result = sync.synchronize(make_request(src,dst,"\\.txt$"),
                                   [&](const SyncProgress& p){ events.push_back(p); });
    assert(result.total_files==0);
    assert(result.files_created==0 && result.files_updated==0);
    assert(result.files_skipped==0 && result.files_failed==0);
    assert(result.is_success());
    assert(events.size()==2);
    for (const auto& e : events) {
        assert(e.total_files==0);
        assert(e.percent_complete()==0.0);
    }
    assert(events.front().current_operation=="Starting synchronization...");
    assert(events.back().current_operation=="Synchronization completed");
    assert(events.back().to_string()=="0/0 (0.0%) - Synchronization completed");
    assert(fs::is_directory(dst)); // root is still created
}

static void test_layout_preserved_and_idempotent(){
    auto base = make_temp_dir("sync_layout");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"top.log","t");
    write_file(src/"x"/"y"/"z"/"deep.log","deep");
    write_file(src/"x"/"mid.log","mid");
    write_file(src/"x"/"ignored.bin","no");

    Synchronizer sync(2);
    auto first = sync.synchronize(make_request(src,dst,"\\.log$"));
    assert(first.total_files==3 && first.files_created==3);
    assert(read_file(dst/"x"/"y"/"z"/"deep.log")=="deep");
    assert(read_file(dst/"x"/"mid.log")=="mid");
    assert(!fs::exists(dst/"x"/"ignored.bin"));

    auto second = sync.synchronize(make_request(src,dst,"\\.log$"));
    assert(second.total_files==3);
    assert(second.files_created==0);
    assert(second.files_updated==0);
    assert(second.files_skipped==3);
    assert(second.files_failed==0);
}

static void test_or_patterns_no_duplicates(){
    auto base = make_temp_dir("sync_or");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"report.csv","1");
    write_file(src/"notes.md","2");
    write_file(src/"image.png","3");

    Synchronizer sync;
    auto result = sync.synchronize(make_request(src,dst,"\\.csv$; \\.MD$ ;report"));
    assert(result.total_files==2);
    assert(result.files_created==2);
    assert(fs::exists(dst/"notes.md"));
    assert(!fs::exists(dst/"image.png"));
}

static void test_progress_events(){
    auto base = make_temp_dir("sync_progress");
    auto src = base/"src"; auto dst = base/"dst";
    for (int i=0;i<20;++i) write_file(src/("f"+std::to_string(i)+".txt"), std::to_string(i));

    std::mutex mtx;
    std::vector<SyncProgress> events;
    Synchronizer sync(4);
    auto result = sync.synchronize(make_request(src,dst),
                                   [&](const SyncProgress& p){ std::lock_guard lock(mtx); events.push_back(p); });
    assert(result.total_files==20);
    assert(events.size()==22);
    assert(events.front().processed_files==0);
    for (std::size_t i=1;i<=20;++i) {
        assert(events[i].processed_files==i);
        assert(events[i].current_operation.rfind("Created: f",0)==0);
    }
    assert(events.back().processed_files==20);
    assert(events.back().percent_complete()==100.0);
    assert(events.back().current_operation=="Synchronization completed");
}

static void test_failure_is_counted_not_thrown(){
    auto base = make_temp_dir("sync_fail");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"a.txt","a");
    write_file(src/"b.txt","b");
    fs::create_directories(dst/"a.txt"); // a directory occupies the target

    Synchronizer sync(2);
    auto req = make_request(src,dst);
    req.max_retries = 1;
    auto result = sync.synchronize(req);
    assert(result.total_files==2);
    assert(result.files_failed==1);
    assert(result.files_created==1);
    assert(!result.is_success());
    assert(result.total_retry_attempts==1);
    assert(result.errors.size()==1);
    assert(result.errors[0].rfind("a.txt: ",0)==0);
    assert(read_file(dst/"b.txt")=="b");
    assert(result.to_string()=="Sync completed: 2 total, 1 created, 0 updated, 0 skipped, 1 failed, 1 retries");
}

static void test_validation_before_io(){
    auto base = make_temp_dir("sync_validate");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"a.txt","a");
    Synchronizer sync;

    assert(throws<InvalidPatternError>([&]{ sync.synchronize(make_request(src,dst,"   ")); }));
    assert(!fs::exists(dst));
    assert(throws<InvalidPatternError>([&]{ sync.synchronize(make_request(src,dst,"[bad")); }));
    assert(!fs::exists(dst));
    assert(throws<ValidationError>([&]{ sync.synchronize(make_request("",dst)); }));
    assert(throws<ValidationError>([&]{ sync.synchronize(make_request(src," \t")); }));
    auto negative = make_request(src,dst);
    negative.max_retries = -1;
    assert(throws<ValidationError>([&]{ sync.synchronize(negative); }));
    assert(!fs::exists(dst));
}

static void test_missing_source(){
    auto base = make_temp_dir("sync_missing");
    Synchronizer sync;
    assert(throws<SourceNotFoundError>([&]{ sync.synchronize(make_request(base/"nope", base/"dst")); }));
    assert(!fs::exists(base/"dst"));
}

static void test_cancellation(){
    auto base = make_temp_dir("sync_cancel");
    auto src = base/"src"; auto dst = base/"dst";
    for (int i=0;i<50;++i) write_file(src/("f"+std::to_string(i)+".txt"), "data");

    Synchronizer sync(2);
    std::stop_source stopped; stopped.request_stop();
    assert(throws<SyncCancelled>([&]{ sync.synchronize(make_request(src,dst), {}, stopped.get_token()); }));
    assert(!fs::exists(dst/"f0.txt"));

    // stop() from inside a progress callback cancels the rest of the run
    bool cancelled=false;
    try {
        sync.synchronize(make_request(src,dst), [&](const SyncProgress& p){
            if (p.processed_files==1) sync.stop();
        });
    } catch (const SyncCancelled&) {
        cancelled=true;
    }
    assert(cancelled);
    std::size_t copied=0;
    for (const auto& e : fs::directory_iterator(dst)) { (void)e; ++copied; }
    assert(copied<50);
}

class CountingObserver final : public SyncObserver {
public:
    std::atomic<std::size_t> scanned{0};
    std::atomic<int> started{0};
    std::atomic<int> finished{0};
    std::atomic<int> retries{0};

    void onScanComplete(const fs::path&, const std::size_t matched) override { scanned = matched; }
    void onFileStart(const fs::path&) override { ++started; }
    void onFileRetry(const fs::path&, int, std::chrono::milliseconds, const std::string&) override { ++retries; }
    void onFileFinish(const FileOutcome&, bool, std::chrono::milliseconds) override { ++finished; }
};

static void test_observer_and_async(){
    auto base = make_temp_dir("sync_observer");
    auto src = base/"src"; auto dst = base/"dst";
    write_file(src/"one.txt","1");
    write_file(src/"two.txt","2");
    write_file(src/"three.txt","3");
    fs::create_directories(dst/"three.txt");

    Synchronizer sync(3);
    assert(sync.max_concurrency()==3);
    CountingObserver observer;
    sync.setObserver(&observer);

    auto req = make_request(src,dst);
    req.max_retries = 2;
    auto future = sync.synchronize_async(req);
    auto result = future.get();
    sync.setObserver(nullptr);

    assert(observer.scanned==3);
    assert(observer.started==3);
    assert(observer.finished==3);
    assert(observer.retries==2);
    assert(result.files_failed==1);
    assert(result.total_retry_attempts==2);
}

static void test_default_concurrency(){
    Synchronizer a(0);
    Synchronizer b(-4);
    assert(a.max_concurrency()>=1);
    assert(b.max_concurrency()==a.max_concurrency());
}

int main(){
    test_three_file_scenario();
    test_empty_source();
    test_layout_preserved_and_idempotent();
    test_or_patterns_no_duplicates();
    test_progress_events();
    test_failure_is_counted_not_thrown();
    test_validation_before_io();
    test_missing_source();
    test_cancellation();
    test_observer_and_async();
    test_default_concurrency();
    std::cout << "Synchronizer tests passed" << std::endl;
    return 0;
}
