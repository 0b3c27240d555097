#ifndef REFLECT_H
#define REFLECT_H

#include <limits>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>

// Visitor based mapping between config structs and JSON. A struct takes part
// by defining, in this namespace,
//
//   template <typename Vis>
//   void reflect(Vis& vis, my_struct& v)
//   {
//       begin_object(vis);
//       field(vis, "name", v.name);
//       end_object(vis);
//   }
//
// The same function drives both reading and writing.
namespace socks5d::reflect
{

// Reads from a parsed document. Missing members leave the target untouched,
// the first value of the wrong type or range stops the walk and its path is
// kept for the error report.
class json_reader
{
   public:
    explicit json_reader(const rapidjson::Value& root) : current_(&root) {}

    [[nodiscard]] const rapidjson::Value& value() const { return *current_; }
    [[nodiscard]] bool ok() const { return failed_path_.empty(); }
    [[nodiscard]] const std::string& failed_path() const { return failed_path_; }

    void fail()
    {
        if (ok())
        {
            failed_path_ = current_path();
        }
    }

    template <typename Fn>
    void visit_member(const char* name, Fn&& fn)
    {
        if (!ok() || !current_->IsObject())
        {
            return;
        }
        const auto it = current_->FindMember(name);
        if (it == current_->MemberEnd())
        {
            return;
        }
        const auto* parent = current_;
        current_ = &it->value;
        names_.push_back(name);
        fn();
        names_.pop_back();
        current_ = parent;
    }

   private:
    [[nodiscard]] std::string current_path() const
    {
        std::string path;
        for (const char* name : names_)
        {
            path.push_back('/');
            path.append(name);
        }
        return path.empty() ? "/" : path;
    }

   private:
    const rapidjson::Value* current_;
    std::vector<const char*> names_;
    std::string failed_path_;
};

class json_writer
{
   public:
    using writer_t = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

    explicit json_writer(writer_t& writer) : writer_(writer) {}

    [[nodiscard]] writer_t& out() { return writer_; }

   private:
    writer_t& writer_;
};

template <typename T>
constexpr bool kIsJsonUnsigned = std::is_integral_v<T> && std::is_unsigned_v<T> && !std::is_same_v<T, bool>;

template <typename T, std::enable_if_t<kIsJsonUnsigned<T>, int> = 0>
void reflect(json_reader& vis, T& v)
{
    const auto& json = vis.value();
    if (!json.IsUint64() || json.GetUint64() > static_cast<std::uint64_t>(std::numeric_limits<T>::max()))
    {
        vis.fail();
        return;
    }
    v = static_cast<T>(json.GetUint64());
}

inline void reflect(json_reader& vis, bool& v)
{
    if (!vis.value().IsBool())
    {
        vis.fail();
        return;
    }
    v = vis.value().GetBool();
}

inline void reflect(json_reader& vis, std::string& v)
{
    const auto& json = vis.value();
    if (!json.IsString())
    {
        vis.fail();
        return;
    }
    v.assign(json.GetString(), json.GetStringLength());
}

template <typename T, std::enable_if_t<kIsJsonUnsigned<T>, int> = 0>
void reflect(json_writer& vis, T& v)
{
    vis.out().Uint64(static_cast<std::uint64_t>(v));
}

inline void reflect(json_writer& vis, bool& v) { vis.out().Bool(v); }

inline void reflect(json_writer& vis, std::string& v) { vis.out().String(v.data(), static_cast<rapidjson::SizeType>(v.size())); }

inline void begin_object(json_reader& vis)
{
    if (!vis.value().IsObject())
    {
        vis.fail();
    }
}

inline void begin_object(json_writer& vis) { vis.out().StartObject(); }

inline void end_object(json_reader&) {}

inline void end_object(json_writer& vis) { vis.out().EndObject(); }

template <typename T>
void field(json_reader& vis, const char* name, T& v)
{
    vis.visit_member(name, [&vis, &v]() { reflect(vis, v); });
}

template <typename T>
void field(json_writer& vis, const char* name, T& v)
{
    vis.out().Key(name);
    reflect(vis, v);
}

// Pretty printed with two space indent.
template <typename T>
std::string to_json(T value)
{
    rapidjson::StringBuffer buffer;
    json_writer::writer_t writer(buffer);
    writer.SetIndent(' ', 2);
    json_writer vis(writer);
    reflect(vis, value);
    return std::string(buffer.GetString(), buffer.GetSize());
}

}    // namespace socks5d::reflect

#endif
