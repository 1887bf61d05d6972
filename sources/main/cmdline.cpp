#include "cmdline.hpp"
#include "core/exceptions.hpp"

#include "protos/options.pb.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_replace.h>
#include <boost/numeric/conversion/cast.hpp>

#include <algorithm>
#include <functional>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace notestore
{
using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using MessageGetter = std::function<Message*()>;

static std::string prepend_dash(std::string_view arg_name)
{
    if (arg_name.empty())
    {
        return {};
    }
    if (arg_name.size() > 1)
    {
        return absl::StrCat("--", arg_name);
    }
    return absl::StrCat("-", arg_name);
}

static void set_enum_by_name(Message* msg, const FieldDescriptor* f, std::string name)
{
    absl::AsciiStrToUpper(&name);
    auto enum_value = f->enum_type()->FindValueByName(name);
    VALIDATE_CONSTRAINT(enum_value != nullptr);
    msg->GetReflection()->SetEnum(msg, f, enum_value);
}

template <typename T>
static void set_field(Message* msg, const FieldDescriptor* f, T v)
{
    auto* reflection = msg->GetReflection();
    if constexpr (std::is_same_v<T, int32_t>)
    {
        VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_INT32);
        reflection->SetInt32(msg, f, v);
    }
    else if constexpr (std::is_same_v<T, int64_t>)
    {
        VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_INT64);
        reflection->SetInt64(msg, f, v);
    }
    else if constexpr (std::is_same_v<T, uint32_t>)
    {
        VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_UINT32);
        reflection->SetUInt32(msg, f, v);
    }
    else if constexpr (std::is_same_v<T, uint64_t>)
    {
        VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_UINT64);
        reflection->SetUInt64(msg, f, v);
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (f->cpp_type() == f->CPPTYPE_ENUM)
        {
            set_enum_by_name(msg, f, std::move(v));
        }
        else
        {
            VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_STRING);
            reflection->SetString(msg, f, std::move(v));
        }
    }
    else
    {
        static_assert(std::is_same_v<T, std::vector<std::string>>);
        VALIDATE_CONSTRAINT(f->cpp_type() == f->CPPTYPE_STRING);
        reflection->ClearField(msg, f);
        for (auto& item : v)
        {
            reflection->AddString(msg, f, std::move(item));
        }
    }
}

template <typename T>
static T get_field(const Message& msg, const FieldDescriptor* f)
{
    auto* reflection = msg.GetReflection();
    if constexpr (std::is_same_v<T, int32_t>)
    {
        return reflection->GetInt32(msg, f);
    }
    else if constexpr (std::is_same_v<T, int64_t>)
    {
        return reflection->GetInt64(msg, f);
    }
    else if constexpr (std::is_same_v<T, uint32_t>)
    {
        return reflection->GetUInt32(msg, f);
    }
    else if constexpr (std::is_same_v<T, uint64_t>)
    {
        return reflection->GetUInt64(msg, f);
    }
    else
    {
        static_assert(std::is_same_v<T, std::string>);
        if (f->cpp_type() == f->CPPTYPE_ENUM)
        {
            return absl::AsciiStrToLower(reflection->GetEnum(msg, f)->name());
        }
        return reflection->GetString(msg, f);
    }
}

static std::vector<std::string> enum_choices(const FieldDescriptor* f)
{
    std::vector<std::string> result;
    for (int i = 0; i < f->enum_type()->value_count(); ++i)
    {
        auto* enum_value = f->enum_type()->value(i);
        if (enum_value->number() == 0)
        {
            continue;    // The "UNSPECIFIED" value is not a choice
        }
        result.emplace_back(absl::AsciiStrToLower(enum_value->name()));
    }
    return result;
}

template <typename T>
static CLI::Option* generic_handle_option(CLI::App* app,
                                          std::string name,
                                          MessageGetter mutable_msg_getter,
                                          const Message& default_value_template,
                                          const FieldDescriptor* f,
                                          const ArgOption& opt)
{
    CLI::Option* o = app->add_option_function<T>(
        std::move(name),
        [getter = std::move(mutable_msg_getter), f](const T& v) { set_field<T>(getter(), f, v); },
        opt.doc());
    if constexpr (!std::is_same_v<T, std::vector<std::string>>)
    {
        if (default_value_template.GetReflection()->HasField(default_value_template, f))
        {
            o->default_val(get_field<T>(default_value_template, f));
        }
    }
    if constexpr (std::is_integral_v<T>)
    {
        if (opt.has_min_value())
        {
            o->check(
                CLI::Range(boost::numeric_cast<T>(opt.min_value()), std::numeric_limits<T>::max()));
        }
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        if (f->cpp_type() == f->CPPTYPE_ENUM)
        {
            o->check(CLI::IsMember(enum_choices(f), CLI::ignore_case));
        }
    }
    return o;
}

static void attach_parser(CLI::App* app,
                          MessageGetter mutable_msg_getter,
                          const Message& default_value_template,
                          std::string_view name_prefix)
{
    const auto* descriptor = default_value_template.GetDescriptor();
    std::vector<const FieldDescriptor*> fields;
    for (int i = 0; i < descriptor->field_count(); ++i)
    {
        fields.push_back(descriptor->field(i));
    }
    std::sort(fields.begin(),
              fields.end(),
              [](const FieldDescriptor* f1, const FieldDescriptor* f2)
              { return f1->number() < f2->number(); });

    for (const FieldDescriptor* f : fields)
    {
        if (!f->options().HasExtension(::notestore::arg_option))
        {
            continue;
        }
        const ArgOption& opt = f->options().GetExtension(::notestore::arg_option);
        if (!opt.has_doc())
        {
            throw std::invalid_argument("Each cmdline option must have doc attached");
        }
        if (f->is_repeated() && f->cpp_type() != f->CPPTYPE_STRING)
        {
            throw std::invalid_argument("Only repeated string fields can become options");
        }
        std::string name = absl::StrCat(name_prefix, absl::StrReplaceAll(f->name(), {{"_", "-"}}));
        if (!opt.positional())
        {
            name = prepend_dash(name);
            if (opt.has_alt_name())
            {
                name.push_back(',');
                name.append(prepend_dash(absl::StrCat(name_prefix, opt.alt_name())));
            }
        }
        CLI::Option* o = nullptr;

        if (f->is_repeated())
        {
            VALIDATE_CONSTRAINT(f->type() != f->TYPE_BYTES);
            o = generic_handle_option<std::vector<std::string>>(
                app, name, mutable_msg_getter, default_value_template, f, opt);
        }
        else
        {
            switch (f->cpp_type())
            {
            case FieldDescriptor::CPPTYPE_INT32:
                o = generic_handle_option<int32_t>(
                    app, name, mutable_msg_getter, default_value_template, f, opt);
                break;
            case FieldDescriptor::CPPTYPE_INT64:
                o = generic_handle_option<int64_t>(
                    app, name, mutable_msg_getter, default_value_template, f, opt);
                break;
            case FieldDescriptor::CPPTYPE_UINT32:
                o = generic_handle_option<uint32_t>(
                    app, name, mutable_msg_getter, default_value_template, f, opt);
                break;
            case FieldDescriptor::CPPTYPE_UINT64:
                o = generic_handle_option<uint64_t>(
                    app, name, mutable_msg_getter, default_value_template, f, opt);
                break;
            case FieldDescriptor::CPPTYPE_STRING:
            case FieldDescriptor::CPPTYPE_ENUM:
                VALIDATE_CONSTRAINT(f->type() != f->TYPE_BYTES);
                o = generic_handle_option<std::string>(
                    app, name, mutable_msg_getter, default_value_template, f, opt);
                break;
            case FieldDescriptor::CPPTYPE_BOOL:
                if (default_value_template.GetReflection()->GetBool(default_value_template, f))
                {
                    throw std::invalid_argument("A default true is confusing, don't use that");
                }
                o = app->add_flag_function(
                    name,
                    [=](int64_t v)
                    {
                        auto* msg = mutable_msg_getter();
                        msg->GetReflection()->SetBool(msg, f, v != 0);
                    },
                    opt.doc());
                break;
            case FieldDescriptor::CPPTYPE_MESSAGE:
                attach_parser(
                    app->add_option_group(opt.doc()),
                    [=]()
                    {
                        auto* msg = mutable_msg_getter();
                        return msg->GetReflection()->MutableMessage(msg, f);
                    },
                    default_value_template.GetReflection()->GetMessage(default_value_template, f),
                    opt.prefix());
                continue;
            default:
                throw std::invalid_argument(absl::StrFormat(
                    "Unsupported proto field type %s for cmdline parsing", f->type_name()));
            }
        }
        if (opt.is_required() || opt.positional())
        {
            o->required();
        }
        if (opt.has_env_key())
        {
            o->envname(opt.env_key());
        }
    }
}

CLI::App* attach_parser(CLI::App* app, Message* msg)
{
    attach_parser(
        app, [msg]() { return msg; }, *msg, "");
    return app;
}
}    // namespace notestore
