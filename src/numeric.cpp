#include "gocore/numeric.hpp"
#include "gocore/panic.hpp"

#include <llvm/ADT/APFloat.h>
#include <llvm/ADT/APInt.h>
#include <llvm/ADT/APSInt.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <algorithm>

namespace gocore {

namespace {

const llvm::fltSemantics& semantics_of(BaseType b){
    return b == BaseType::Float32 ? llvm::APFloat::IEEEsingle() : llvm::APFloat::IEEEdouble();
}

value from_bits(TypeContext& ctx, TypeId target, uint64_t bits){
    const Type& t = ctx.at(target);
    unsigned w = base_width(t.base);
    int_value iv;
    iv.width = static_cast<uint8_t>(w);
    iv.is_signed = is_signed_base(t.base);
    iv.bits = w >= 64 ? bits : (bits & ((uint64_t{1} << w) - 1));
    return value{target, iv};
}

value from_apfloat(TypeContext& ctx, TypeId target, const llvm::APFloat& f){
    if(ctx.is_base(target, BaseType::Float32)) return value{target, f.convertToFloat()};
    return value{target, f.convertToDouble()};
}

llvm::APFloat to_apfloat(const value& v){
    if(v.is_float32()) return llvm::APFloat(v.as_float32());
    return llvm::APFloat(v.as_float64());
}

[[noreturn]] void cannot_convert(const TypeContext& ctx, const value& v, TypeId target){
    raise(codes::CannotConvert, "cannot convert " + to_string(ctx, v) + " (type " + ctx.to_string(v.type) +
          ") to type " + ctx.to_string(target));
}

} // namespace

value convert(TypeContext& ctx, const value& v, TypeId target){
    if(v.type == target) return v;
    if(!ctx.is_numeric(target) || !ctx.is_numeric(v.type)) cannot_convert(ctx, v, target);
    const Type& tt = ctx.at(target);

    if(v.is_int()){
        const int_value& iv = v.as_int();
        llvm::APInt src(iv.width, iv.bits);
        if(ctx.is_integer(target)){
            unsigned w = base_width(tt.base);
            llvm::APInt out = iv.is_signed ? src.sextOrTrunc(w) : src.zextOrTrunc(w);
            return from_bits(ctx, target, out.getZExtValue());
        }
        llvm::APFloat f(semantics_of(tt.base));
        f.convertFromAPInt(src, iv.is_signed, llvm::APFloat::rmNearestTiesToEven);
        return from_apfloat(ctx, target, f);
    }

    llvm::APFloat f = to_apfloat(v);
    if(ctx.is_float(target)){
        bool losesInfo = false;
        f.convert(semantics_of(tt.base), llvm::APFloat::rmNearestTiesToEven, &losesInfo);
        return from_apfloat(ctx, target, f);
    }
    unsigned w = base_width(tt.base);
    llvm::APSInt out(w, /*isUnsigned*/ !is_signed_base(tt.base));
    bool isExact = false;
    f.convertToInteger(out, llvm::APFloat::rmTowardZero, &isExact);
    return from_bits(ctx, target, out.getZExtValue());
}

value convert_constant(TypeContext& ctx, std::string_view literal, TypeId target){
    llvm::StringRef text(literal.data(), literal.size());
    text = text.trim();
    if(text.empty())
        raise(codes::CannotConvert, "empty numeric constant");
    if(!ctx.is_numeric(target))
        raise(codes::CannotConvert, "cannot convert constant " + text.str() + " to type " + ctx.to_string(target));
    const Type& tt = ctx.at(target);
    bool floatSyntax = text.find_first_of(".eE") != llvm::StringRef::npos;

    if(ctx.is_float(target)){
        llvm::APFloat f(semantics_of(tt.base));
        auto st = f.convertFromString(text, llvm::APFloat::rmNearestTiesToEven);
        if(!st){
            llvm::consumeError(st.takeError());
            raise(codes::CannotConvert, "invalid numeric constant " + text.str());
        }
        if(*st & llvm::APFloat::opOverflow)
            raise(codes::ConstantOverflow, "constant " + text.str() + " overflows " + ctx.to_string(target));
        return from_apfloat(ctx, target, f);
    }

    unsigned w = base_width(tt.base);
    bool isSigned = is_signed_base(tt.base);
    llvm::APInt wide;
    if(floatSyntax){
        // exact decimal -> integer only when there is no fractional part
        llvm::APFloat f(llvm::APFloat::IEEEquad());
        auto st = f.convertFromString(text, llvm::APFloat::rmNearestTiesToEven);
        if(!st){
            llvm::consumeError(st.takeError());
            raise(codes::CannotConvert, "invalid numeric constant " + text.str());
        }
        llvm::APSInt r(128, /*isUnsigned*/ false);
        bool isExact = false;
        auto cst = f.convertToInteger(r, llvm::APFloat::rmTowardZero, &isExact);
        if(!isExact || (cst & llvm::APFloat::opInvalidOp))
            raise(codes::ConstantOverflow, "constant " + text.str() + " truncated to integer");
        wide = r;
    } else {
        bool neg = text.consume_front("-");
        if(!neg) text.consume_front("+");
        llvm::APInt mag;
        if(text.empty() || text.getAsInteger(10, mag))
            raise(codes::CannotConvert, "invalid numeric constant " + std::string(literal));
        unsigned bits = std::max(mag.getActiveBits() + 1, 65u);
        wide = mag.zextOrTrunc(bits);
        if(neg) wide = -wide;
    }
    bool fits = isSigned ? wide.isSignedIntN(w) : (!wide.isNegative() && wide.isIntN(w));
    if(!fits)
        raise(codes::ConstantOverflow, "constant " + std::string(literal) + " overflows " + ctx.to_string(target));
    return from_bits(ctx, target, wide.trunc(w).getZExtValue());
}

value coerce(TypeContext& ctx, const value& v, TypeId target){
    if(v.type == target) return v;
    if(ctx.is_any(target)) return box(ctx, v);
    if(v.is_untyped_nil() && ctx.is_nilable(target)) return zero_value(ctx, target);
    if(ctx.is_numeric(target) && ctx.is_numeric(v.type)) return convert(ctx, v, target);
    raise(codes::CannotUse, "cannot use " + to_string(ctx, v) + " (type " + ctx.to_string(v.type) +
          ") as type " + ctx.to_string(target));
}

} // namespace gocore
