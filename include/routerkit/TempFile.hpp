/**
 * @file TempFile.hpp
 * @brief Scoped temporary files
 *
 * Rendered documents, the certificate bundle and the kubeconfig copy only
 * live as long as the TempFile that owns them; the file is removed when
 * the owner goes out of scope, on every exit path.
 */

#ifndef ROUTERKIT_TEMPFILE_HPP
#define ROUTERKIT_TEMPFILE_HPP

#include <string>

namespace routerkit {

class TempFile {
public:
    /**
     * @brief Create an empty, uniquely named file in the temp directory
     * @param prefix File name prefix
     * @param suffix File name suffix (e.g. ".yml")
     * @throws RouterKitError if the file cannot be created
     */
    explicit TempFile(const std::string& prefix = "routerkit", const std::string& suffix = "");

    /**
     * @brief Create a temp file holding a copy of @p source
     * @throws FileNotFoundError if @p source does not exist
     */
    static TempFile copy_of(const std::string& source, const std::string& prefix = "routerkit");

    ~TempFile();

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const noexcept { return path_; }

    /**
     * @brief Replace the file's contents
     * @throws RouterKitError on IO failure
     */
    void write(const std::string& contents) const;

    /**
     * @brief Append to the file
     * @throws RouterKitError on IO failure
     */
    void append(const std::string& contents) const;

private:
    void release() noexcept;

    std::string path_;
};

} // namespace routerkit

#endif // ROUTERKIT_TEMPFILE_HPP
