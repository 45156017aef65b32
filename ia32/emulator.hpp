#pragma once

#include "IA32.hpp"
namespace ia32
{
  namespace handlers
  {
    // Arithmetic Instructions
    void add ( uint8_t opcode, IA32& context );
    void adc ( uint8_t opcode, IA32& context );
    void sub ( uint8_t opcode, IA32& context );
    void sbb ( uint8_t opcode, IA32& context );
    void inc ( uint8_t opcode, IA32& context );
    void dec ( uint8_t opcode, IA32& context );
    void group1 ( uint8_t opcode, IA32& context );
    void group3 ( uint8_t opcode, IA32& context );
    void group4 ( uint8_t opcode, IA32& context );
    void imul ( uint8_t opcode, IA32& context );
    void imul_imm ( uint8_t opcode, IA32& context );
    void xadd ( uint8_t opcode, IA32& context );
    void cdq ( uint8_t opcode, IA32& context );
    void cwde ( uint8_t opcode, IA32& context );

    // Bitwise and Logical Instructions
    void and_ ( uint8_t opcode, IA32& context );
    void or_ ( uint8_t opcode, IA32& context );
    void xor_ ( uint8_t opcode, IA32& context );
    void group2 ( uint8_t opcode, IA32& context );

    // Bit Scan Instructions
    void bsf ( uint8_t opcode, IA32& context );
    void bsr ( uint8_t opcode, IA32& context );

    // Comparison Instructions
    void cmp ( uint8_t opcode, IA32& context );
    void test ( uint8_t opcode, IA32& context );

    // Conditional Instructions
    void cmovcc ( uint8_t opcode, IA32& context );
    void setcc ( uint8_t opcode, IA32& context );

    // Control Flow Instructions
    void jcc_short ( uint8_t opcode, IA32& context );
    void jcc_near ( uint8_t opcode, IA32& context );
    void jmp_short ( uint8_t opcode, IA32& context );
    void jmp_near ( uint8_t opcode, IA32& context );
    void call ( uint8_t opcode, IA32& context );
    void ret ( uint8_t opcode, IA32& context );
    void ret_imm ( uint8_t opcode, IA32& context );
    void loop ( uint8_t opcode, IA32& context );
    void jecxz ( uint8_t opcode, IA32& context );
    void group5 ( uint8_t opcode, IA32& context );

    // Stack and Frame Instructions
    void push_reg ( uint8_t opcode, IA32& context );
    void pop_reg ( uint8_t opcode, IA32& context );
    void push_imm ( uint8_t opcode, IA32& context );
    void pop_rm ( uint8_t opcode, IA32& context );
    void pushad ( uint8_t opcode, IA32& context );
    void popad ( uint8_t opcode, IA32& context );
    void pushfd ( uint8_t opcode, IA32& context );
    void popfd ( uint8_t opcode, IA32& context );
    void leave ( uint8_t opcode, IA32& context );

    // Data Movement Instructions
    void mov ( uint8_t opcode, IA32& context );
    void mov_moffs ( uint8_t opcode, IA32& context );
    void mov_reg_imm8 ( uint8_t opcode, IA32& context );
    void mov_reg_imm ( uint8_t opcode, IA32& context );
    void mov_rm_imm ( uint8_t opcode, IA32& context );
    void lea ( uint8_t opcode, IA32& context );
    void xchg ( uint8_t opcode, IA32& context );
    void xchg_eax ( uint8_t opcode, IA32& context );
    void load_far_pointer ( uint8_t opcode, IA32& context );
    void movzx ( uint8_t opcode, IA32& context );
    void movsx ( uint8_t opcode, IA32& context );
    void nop ( uint8_t opcode, IA32& context );
    void nop_rm ( uint8_t opcode, IA32& context );

    // String Operations
    void movs ( uint8_t opcode, IA32& context );
    void cmps ( uint8_t opcode, IA32& context );
    void stos ( uint8_t opcode, IA32& context );
    void lods ( uint8_t opcode, IA32& context );
    void scas ( uint8_t opcode, IA32& context );

    // x87 Floating-Point Instructions, one handler per escape byte
    void fpu_d8 ( uint8_t opcode, IA32& context );
    void fpu_d9 ( uint8_t opcode, IA32& context );
    void fpu_da ( uint8_t opcode, IA32& context );
    void fpu_db ( uint8_t opcode, IA32& context );
    void fpu_dc ( uint8_t opcode, IA32& context );
    void fpu_dd ( uint8_t opcode, IA32& context );
    void fpu_de ( uint8_t opcode, IA32& context );
    void fpu_df ( uint8_t opcode, IA32& context );

    // System Instructions
    void hlt ( uint8_t opcode, IA32& context );
    void int_ ( uint8_t opcode, IA32& context );
    void int3 ( uint8_t opcode, IA32& context );
    void clc ( uint8_t opcode, IA32& context );
    void stc ( uint8_t opcode, IA32& context );
    void cmc ( uint8_t opcode, IA32& context );
    void cld ( uint8_t opcode, IA32& context );
    void std ( uint8_t opcode, IA32& context );
    void sahf ( uint8_t opcode, IA32& context );
    void lahf ( uint8_t opcode, IA32& context );
    void fwait ( uint8_t opcode, IA32& context );
    void two_byte ( uint8_t opcode, IA32& context );
  };
};
