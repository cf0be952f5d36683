// frontend/src/bc/serialize.cpp
#include <onec/bc/Serialize.hpp>

#include <cstring>
#include <type_traits>


namespace onec::bc {

    namespace {

        enum class ValueTag : uint8_t { kNull = 0, kInt, kFloat, kBool, kString };

        enum class OperandTag : uint8_t {
            kNone = 0, kValue, kVar, kJump, kLabel, kCall, kCount,
        };

        // --------------------
        // writer
        // --------------------
        struct Writer {
            std::vector<uint8_t> buf;

            void u8(uint8_t v) { buf.push_back(v); }

            void u16(uint16_t v) {
                u8(static_cast<uint8_t>(v & 0xFF));
                u8(static_cast<uint8_t>(v >> 8));
            }

            void u32(uint32_t v) {
                for (int i = 0; i < 4; ++i) u8(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
            }

            void u64(uint64_t v) {
                for (int i = 0; i < 8; ++i) u8(static_cast<uint8_t>((v >> (i * 8)) & 0xFF));
            }

            void str(const std::string& s) {
                u32(static_cast<uint32_t>(s.size()));
                buf.insert(buf.end(), s.begin(), s.end());
            }

            void value(const Value& v) {
                std::visit([&](auto&& x) {
                    using T = std::decay_t<decltype(x)>;

                    if constexpr (std::is_same_v<T, std::monostate>) {
                        u8(static_cast<uint8_t>(ValueTag::kNull));
                    } else if constexpr (std::is_same_v<T, int64_t>) {
                        u8(static_cast<uint8_t>(ValueTag::kInt));
                        u64(static_cast<uint64_t>(x));
                    } else if constexpr (std::is_same_v<T, double>) {
                        u8(static_cast<uint8_t>(ValueTag::kFloat));
                        uint64_t bits = 0;
                        std::memcpy(&bits, &x, sizeof(bits));
                        u64(bits);
                    } else if constexpr (std::is_same_v<T, bool>) {
                        u8(static_cast<uint8_t>(ValueTag::kBool));
                        u8(x ? 1 : 0);
                    } else {
                        u8(static_cast<uint8_t>(ValueTag::kString));
                        str(x);
                    }
                }, v);
            }

            void operand(const Operand& o) {
                std::visit([&](auto&& x) {
                    using T = std::decay_t<decltype(x)>;

                    if constexpr (std::is_same_v<T, std::monostate>) {
                        u8(static_cast<uint8_t>(OperandTag::kNone));
                    } else if constexpr (std::is_same_v<T, Value>) {
                        u8(static_cast<uint8_t>(OperandTag::kValue));
                        value(x);
                    } else if constexpr (std::is_same_v<T, VarName>) {
                        u8(static_cast<uint8_t>(OperandTag::kVar));
                        str(x.name);
                    } else if constexpr (std::is_same_v<T, JumpTarget>) {
                        u8(static_cast<uint8_t>(OperandTag::kJump));
                        u32(x.index);
                    } else if constexpr (std::is_same_v<T, Label>) {
                        u8(static_cast<uint8_t>(OperandTag::kLabel));
                        u32(x.id);
                    } else if constexpr (std::is_same_v<T, CallTarget>) {
                        u8(static_cast<uint8_t>(OperandTag::kCall));
                        str(x.name);
                        u32(x.argc);
                    } else {
                        u8(static_cast<uint8_t>(OperandTag::kCount));
                        u32(x.n);
                    }
                }, o);
            }
        };

        // --------------------
        // reader
        // --------------------
        struct Reader {
            const std::vector<uint8_t>& buf;
            size_t pos = 0;
            std::string err{};

            explicit Reader(const std::vector<uint8_t>& b) : buf(b) {}

            bool need(size_t n) {
                if (pos + n > buf.size()) {
                    if (err.empty()) err = "unexpected end of data at offset " + std::to_string(pos);
                    return false;
                }
                return true;
            }

            bool u8(uint8_t& v) {
                if (!need(1)) return false;
                v = buf[pos++];
                return true;
            }

            bool u16(uint16_t& v) {
                if (!need(2)) return false;
                v = static_cast<uint16_t>(buf[pos] | (buf[pos + 1] << 8));
                pos += 2;
                return true;
            }

            bool u32(uint32_t& v) {
                if (!need(4)) return false;
                v = 0;
                for (int i = 0; i < 4; ++i) v |= static_cast<uint32_t>(buf[pos + i]) << (i * 8);
                pos += 4;
                return true;
            }

            bool u64(uint64_t& v) {
                if (!need(8)) return false;
                v = 0;
                for (int i = 0; i < 8; ++i) v |= static_cast<uint64_t>(buf[pos + i]) << (i * 8);
                pos += 8;
                return true;
            }

            bool str(std::string& s) {
                uint32_t n = 0;
                if (!u32(n) || !need(n)) return false;
                s.assign(reinterpret_cast<const char*>(buf.data() + pos), n);
                pos += n;
                return true;
            }

            bool value(Value& v) {
                uint8_t tag = 0;
                if (!u8(tag)) return false;

                switch (static_cast<ValueTag>(tag)) {
                    case ValueTag::kNull:
                        v = std::monostate{};
                        return true;
                    case ValueTag::kInt: {
                        uint64_t x = 0;
                        if (!u64(x)) return false;
                        v = static_cast<int64_t>(x);
                        return true;
                    }
                    case ValueTag::kFloat: {
                        uint64_t bits = 0;
                        if (!u64(bits)) return false;
                        double d = 0.0;
                        std::memcpy(&d, &bits, sizeof(d));
                        v = d;
                        return true;
                    }
                    case ValueTag::kBool: {
                        uint8_t b = 0;
                        if (!u8(b)) return false;
                        v = (b != 0);
                        return true;
                    }
                    case ValueTag::kString: {
                        std::string s;
                        if (!str(s)) return false;
                        v = std::move(s);
                        return true;
                    }
                }
                err = "unknown value tag " + std::to_string(tag);
                return false;
            }

            bool operand(Operand& o) {
                uint8_t tag = 0;
                if (!u8(tag)) return false;

                switch (static_cast<OperandTag>(tag)) {
                    case OperandTag::kNone:
                        o = std::monostate{};
                        return true;
                    case OperandTag::kValue: {
                        Value v;
                        if (!value(v)) return false;
                        o = std::move(v);
                        return true;
                    }
                    case OperandTag::kVar: {
                        VarName n;
                        if (!str(n.name)) return false;
                        o = std::move(n);
                        return true;
                    }
                    case OperandTag::kJump: {
                        JumpTarget t;
                        if (!u32(t.index)) return false;
                        o = t;
                        return true;
                    }
                    case OperandTag::kLabel: {
                        Label l;
                        if (!u32(l.id)) return false;
                        o = l;
                        return true;
                    }
                    case OperandTag::kCall: {
                        CallTarget c;
                        if (!str(c.name) || !u32(c.argc)) return false;
                        o = std::move(c);
                        return true;
                    }
                    case OperandTag::kCount: {
                        Count c;
                        if (!u32(c.n)) return false;
                        o = c;
                        return true;
                    }
                }
                err = "unknown operand tag " + std::to_string(tag);
                return false;
            }
        };

    } // namespace

    std::vector<uint8_t> serialize(const Module& m) {
        Writer w;
        for (uint8_t b : k_magic) w.u8(b);
        w.u16(k_format_version);

        w.str(m.entry_point);
        w.u32(static_cast<uint32_t>(m.size()));

        for (const auto& f : m.functions()) {
            w.str(f.name);

            w.u32(f.param_count());
            for (const auto& p : f.param_names) w.str(p);

            w.u32(static_cast<uint32_t>(f.instructions.size()));
            for (const auto& inst : f.instructions) {
                w.u8(static_cast<uint8_t>(inst.op));
                w.operand(inst.operand);

                w.u8(inst.loc.has_value() ? 1 : 0);
                if (inst.loc) {
                    w.u32(inst.loc->file_id);
                    w.u32(inst.loc->lo);
                    w.u32(inst.loc->hi);
                    w.u32(inst.loc->line);
                    w.u32(inst.loc->col);
                }
            }

            w.u32(static_cast<uint32_t>(f.constants.size()));
            for (const auto& c : f.constants) w.value(c);
        }

        return std::move(w.buf);
    }

    bool deserialize(const std::vector<uint8_t>& bytes, Module& out, std::string& err) {
        err.clear();
        Reader r(bytes);

        auto fail = [&](const std::string& msg) {
            err = r.err.empty() ? msg : r.err;
            return false;
        };

        for (uint8_t want : k_magic) {
            uint8_t b = 0;
            if (!r.u8(b)) return fail("truncated header");
            if (b != want) return fail("bad magic (not a 1BC file)");
        }

        uint16_t ver = 0;
        if (!r.u16(ver)) return fail("truncated header");
        if (ver != k_format_version) {
            return fail("unsupported format version " + std::to_string(ver));
        }

        Module m;
        uint32_t fn_count = 0;
        if (!r.str(m.entry_point) || !r.u32(fn_count)) return fail("truncated module header");

        for (uint32_t fi = 0; fi < fn_count; ++fi) {
            Function f;
            uint32_t pc = 0;
            if (!r.str(f.name) || !r.u32(pc)) return fail("truncated function header");

            for (uint32_t i = 0; i < pc; ++i) {
                std::string p;
                if (!r.str(p)) return fail("truncated parameter list");
                f.param_names.push_back(std::move(p));
            }

            uint32_t ic = 0;
            if (!r.u32(ic)) return fail("truncated instruction count");

            for (uint32_t i = 0; i < ic; ++i) {
                Instruction inst;
                uint8_t op = 0;
                if (!r.u8(op)) return fail("truncated instruction");
                if (op >= k_op_count) return fail("unknown opcode " + std::to_string(op));
                inst.op = static_cast<Op>(op);

                if (!r.operand(inst.operand)) return fail("bad operand");

                uint8_t has_loc = 0;
                if (!r.u8(has_loc)) return fail("truncated instruction");
                if (has_loc) {
                    Span sp{};
                    if (!r.u32(sp.file_id) || !r.u32(sp.lo) || !r.u32(sp.hi) ||
                        !r.u32(sp.line) || !r.u32(sp.col)) {
                        return fail("truncated location");
                    }
                    inst.loc = sp;
                }
                f.instructions.push_back(std::move(inst));
            }

            uint32_t cc = 0;
            if (!r.u32(cc)) return fail("truncated constant count");
            for (uint32_t i = 0; i < cc; ++i) {
                Value v;
                if (!r.value(v)) return fail("bad constant");
                f.constants.push_back(std::move(v));
            }

            m.put_function(std::move(f));
        }

        if (r.pos != bytes.size()) return fail("trailing bytes after module");

        out = std::move(m);
        return true;
    }

} // namespace onec::bc
