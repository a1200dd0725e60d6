#include "../libflashsync/include/action_resolver.hpp"
#include "../libflashsync/include/file_utils.hpp"
#include "../libflashsync/include/pattern_set.hpp"
#include "../libflashsync/include/retry_executor.hpp"
#include "../libflashsync/include/sync_errors.hpp"
#include "../libflashsync/include/tree_scanner.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <random>
#include <stop_token>

using namespace flashsync;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string &name){
    fs::path p = fs::path("unit_tmp")/name;
    fs::remove_all(p); fs::create_directories(p); return p;
}
static void write_file(const fs::path &p, std::string_view data){ fs::create_directories(p.parent_path()); std::ofstream o(p, std::ios::binary); o<<data; }
static std::string read_file(const fs::path &p){ std::ifstream i(p, std::ios::binary); return std::string((std::istreambuf_iterator<char>(i)),{}); }

static void test_missing_destination_is_created(){
    auto d = make_temp_dir("res_missing");
    write_file(d/"a.txt","a");
    assert(resolve_action(d/"a.txt", d/"out"/"a.txt")==SyncAction::Created);
}

static void test_timestamps(){
    auto d = make_temp_dir("res_time");
    auto src = d/"src.txt"; auto dst = d/"dst.txt";
    write_file(src,"new"); write_file(dst,"old");
    const auto t = fs::last_write_time(src);

    fs::last_write_time(dst, t - std::chrono::hours(1));
    assert(resolve_action(src,dst)==SyncAction::Updated);

    fs::last_write_time(dst, t); // equal never updates
    assert(resolve_action(src,dst)==SyncAction::Skipped);

    fs::last_write_time(dst, t + std::chrono::hours(1));
    assert(resolve_action(src,dst)==SyncAction::Skipped);
}

static void test_sync_file_copies_and_overwrites(){
    auto d = make_temp_dir("res_copy");
    auto src = d/"src"/"a.txt"; auto dst = d/"dst"/"sub"/"a.txt";
    write_file(src,"first version");
    assert(sync_file(src,dst,false)==SyncAction::Created);
    assert(read_file(dst)=="first version");

    // shorter content must truncate, not leave a tail behind
    write_file(src,"v2");
    fs::last_write_time(dst, fs::last_write_time(src) - std::chrono::minutes(5));
    assert(sync_file(src,dst,false)==SyncAction::Updated);
    assert(read_file(dst)=="v2");

    assert(sync_file(src,dst,false)==SyncAction::Skipped);
}

static void test_sync_file_dry_run_touches_nothing(){
    auto d = make_temp_dir("res_dry");
    auto src = d/"a.txt"; auto dst = d/"dst"/"deep"/"a.txt";
    write_file(src,"x");
    assert(sync_file(src,dst,true)==SyncAction::Created);
    assert(!fs::exists(d/"dst"));
}

static void test_directory_in_the_way_fails(){
    auto d = make_temp_dir("res_clash");
    auto src = d/"a.txt"; auto dst = d/"dst"/"a.txt";
    write_file(src,"x");
    fs::create_directories(dst);
    assert(resolve_action(src,dst)==SyncAction::Created);
    bool threw=false;
    try { sync_file(src,dst,false); } catch (const std::exception&) { threw=true; }
    assert(threw);
}

static void test_large_copy_is_byte_exact(){
    auto d = make_temp_dir("res_large");
    std::mt19937_64 rng(4242);
    std::string data; data.resize(3*COPY_BUFFER_SIZE + 123);
    for(char &c: data) c = static_cast<char>(rng() & 0xFF);
    write_file(d/"big.bin",data);
    const auto bytes = copy_file_contents(d/"big.bin", d/"copy.bin");
    assert(bytes==data.size());
    assert(read_file(d/"copy.bin")==data);
}

// /proc/self/mem opens fine but fails with EIO on the first read
static void test_read_error_mid_copy_is_not_skipped_on_retry(){
    const fs::path unreadable = "/proc/self/mem";
    if (!fs::exists(unreadable)) return;
    auto d = make_temp_dir("res_read_error");

    // new destination: the partial file is removed, every attempt fails
    auto fresh = d/"fresh.bin";
    auto out = execute_with_retry("fresh.bin", 1, {}, [&](int){ return sync_file(unreadable, fresh, false); });
    assert(out.action==SyncAction::Failed);
    assert(out.attempts==2);
    assert(!fs::exists(fresh));

    // existing destination: the truncated copy stays older than the source
    auto stale = d/"stale.bin";
    write_file(stale,"previous content");
    fs::last_write_time(stale, fs::last_write_time(unreadable) - std::chrono::hours(1));
    out = execute_with_retry("stale.bin", 1, {}, [&](int){ return sync_file(unreadable, stale, false); });
    assert(out.action==SyncAction::Failed);
    assert(out.attempts==2);
    assert(resolve_action(unreadable, stale)==SyncAction::Updated);
}

static void test_copy_honours_stop(){
    auto d = make_temp_dir("res_copy_stop");
    write_file(d/"a.bin", std::string(COPY_BUFFER_SIZE*2,'z'));
    std::stop_source ss; ss.request_stop();
    bool cancelled=false;
    try { copy_file_contents(d/"a.bin", d/"b.bin", ss.get_token()); }
    catch (const SyncCancelled&) { cancelled=true; }
    assert(cancelled);
}

static void test_scan_matches_base_name_only(){
    auto root = make_temp_dir("scan_tree");
    write_file(root/"keep.txt","1");
    write_file(root/"notes.txt.d"/"inner.bin","2"); // directory name matches, file does not
    write_file(root/"a"/"b"/"deep.TXT","3");
    write_file(root/"skip.jpg","4");

    auto files = scan_tree(root, PatternSet::compile("\\.txt$"));
    assert(files.size()==2);
    std::vector<fs::path> rel;
    for (const auto& f : files) rel.push_back(f.relative);
    std::sort(rel.begin(), rel.end());
    assert(rel[0]==fs::path("a")/"b"/"deep.TXT");
    assert(rel[1]==fs::path("keep.txt"));
    for (const auto& f : files) assert(f.source==root/f.relative);
}

static void test_scan_cancelled(){
    auto root = make_temp_dir("scan_cancel");
    write_file(root/"a.txt","1");
    std::stop_source ss; ss.request_stop();
    bool cancelled=false;
    try { scan_tree(root, PatternSet::compile(".*"), ss.get_token()); }
    catch (const SyncCancelled&) { cancelled=true; }
    assert(cancelled);
}

int main(){
    test_missing_destination_is_created();
    test_timestamps();
    test_sync_file_copies_and_overwrites();
    test_sync_file_dry_run_touches_nothing();
    test_directory_in_the_way_fails();
    test_large_copy_is_byte_exact();
    test_read_error_mid_copy_is_not_skipped_on_retry();
    test_copy_honours_stop();
    test_scan_matches_base_name_only();
    test_scan_cancelled();
    std::cout << "Resolver tests passed" << std::endl;
    return 0;
}
