#include "kvdb.h"
#include "log.h"

#include <memory>
#include <sys/stat.h>
#include <sys/types.h>

static inline void mpay_mkdir(const std::string& p){ ::mkdir(p.c_str(), 0755); }

namespace mpay {

KVDB::~KVDB(){ close(); }

bool KVDB::open(const std::string& path, std::string* err){
    close();
    path_ = path;
    mpay_mkdir(path_);

    options_ = leveldb::Options();
    options_.create_if_missing = true;
    options_.paranoid_checks = true;
    block_cache_.reset(leveldb::NewLRUCache(8*1024*1024)); // 8MB
    bloom_ = leveldb::NewBloomFilterPolicy(10);
    options_.block_cache = block_cache_.get();
    options_.filter_policy = bloom_;
    leveldb::DB* db=nullptr;
    auto s = leveldb::DB::Open(options_, path_, &db);
    if(!s.ok()){
        if(err) *err = s.ToString();
        MPAY_LOG_ERROR(LogCategory::DB, "open " + path_ + " failed: " + s.ToString());
        delete bloom_;
        bloom_ = nullptr;
        return false;
    }
    db_ = db;
    MPAY_LOG_DEBUG(LogCategory::DB, "opened " + path_);
    return true;
}

bool KVDB::get(const std::string& k, std::string& v, std::string* err) const {
    if(!db_) { if(err)*err="db not open"; return false; }
    auto s = db_->Get(leveldb::ReadOptions(), k, &v);
    if(!s.ok()){
        if(s.IsNotFound()) return false;
        if(err) *err = s.ToString();
        return false;
    }
    return true;
}

bool KVDB::put(const std::string& k, const std::string& v, bool sync, std::string* err){
    if(!db_) { if(err)*err="db not open"; return false; }
    leveldb::WriteOptions wo;
    wo.sync = sync;
    auto s = db_->Put(wo, k, v);
    if(!s.ok()){ if(err)*err=s.ToString(); return false; }
    return true;
}

bool KVDB::del(const std::string& k, bool sync, std::string* err){
    if(!db_) { if(err)*err="db not open"; return false; }
    leveldb::WriteOptions wo;
    wo.sync = sync;
    auto s = db_->Delete(wo, k);
    if(!s.ok()){ if(err)*err=s.ToString(); return false; }
    return true;
}

bool KVDB::scan_prefix(const std::string& prefix,
                       const std::function<bool(const std::string&, const std::string&)>& fn,
                       std::string* err) const {
    if(!db_) { if(err)*err="db not open"; return false; }
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(leveldb::ReadOptions()));
    for(it->Seek(prefix); it->Valid(); it->Next()){
        leveldb::Slice k = it->key();
        if(!k.starts_with(prefix)) break;
        if(!fn(k.ToString(), it->value().ToString())) break;
    }
    if(!it->status().ok()){ if(err)*err=it->status().ToString(); return false; }
    return true;
}

KVDB::Batch::Batch(KVDB& db) : db_(db) {}

void KVDB::Batch::put(const std::string& k, const std::string& v){
    wb_.Put(k, v);
}
void KVDB::Batch::del(const std::string& k){
    wb_.Delete(k);
}
bool KVDB::Batch::commit(bool sync, std::string* err){
    if(!db_.db_){ if(err)*err="db not open"; return false; }
    leveldb::WriteOptions wo;
    wo.sync = sync;
    auto s = db_.db_->Write(wo, &wb_);
    if(!s.ok()){ if(err)*err=s.ToString(); return false; }
    wb_.Clear();
    return true;
}

void KVDB::close(){
    if(!db_) return;
    delete db_;
    db_ = nullptr;
    // The cache and filter must outlive the DB that references them
    block_cache_.reset();
    delete bloom_;
    bloom_ = nullptr;
}

}
