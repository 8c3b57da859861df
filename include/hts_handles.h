#ifndef COVTABLE_HTS_HANDLES_H
#define COVTABLE_HTS_HANDLES_H

#include <cstdlib>
#include <memory>

#include <htslib/hts.h>
#include <htslib/kstring.h>

namespace covtable {

struct HtsFileCloser {
    void operator()(htsFile* fp) const {
        if (fp != nullptr) {
            hts_close(fp);
        }
    }
};

using HtsFilePtr = std::unique_ptr<htsFile, HtsFileCloser>;

// Owns the buffer hts_getline() grows into.
class KStringBuffer {
public:
    KStringBuffer() = default;
    ~KStringBuffer() { free(str_.s); }

    KStringBuffer(const KStringBuffer&) = delete;
    KStringBuffer& operator=(const KStringBuffer&) = delete;

    kstring_t* get() { return &str_; }
    const char* data() const { return str_.s; }
    size_t size() const { return str_.l; }

private:
    kstring_t str_ = {0, 0, nullptr};
};

}  // namespace covtable

#endif  // COVTABLE_HTS_HANDLES_H
