#pragma once
#include <string>
#include <cstdint>
#include <memory>
#include <functional>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace mpay {

class KVDB {
public:
    KVDB() = default;
    ~KVDB();

    // Create/open a database directory. Creates it if missing.
    bool open(const std::string& path, std::string* err = nullptr);
    bool is_open() const { return db_ != nullptr; }

    // Returns false on miss; `err` is only set for real failures.
    bool get(const std::string& k, std::string& v, std::string* err = nullptr) const;
    bool put(const std::string& k, const std::string& v, bool sync=true, std::string* err = nullptr);
    bool del(const std::string& k, bool sync=true, std::string* err = nullptr);

    // Visit every key starting with `prefix` in key order. Stop early when fn returns false.
    bool scan_prefix(const std::string& prefix,
                     const std::function<bool(const std::string& k, const std::string& v)>& fn,
                     std::string* err = nullptr) const;

    // Batched writer (atomic).
    class Batch {
    public:
        explicit Batch(KVDB& db);
        void put(const std::string& k, const std::string& v);
        void del(const std::string& k);
        bool commit(bool sync=true, std::string* err = nullptr);
    private:
        KVDB& db_;
        leveldb::WriteBatch wb_;
    };

    void close();

private:
    KVDB(const KVDB&) = delete;
    KVDB& operator=(const KVDB&) = delete;

    leveldb::DB* db_ = nullptr;
    leveldb::Options options_;
    std::unique_ptr<leveldb::Cache> block_cache_;
    const leveldb::FilterPolicy* bloom_ = nullptr;
    std::string path_;
};

}
