export module RHI;

export import :Types;
export import :Pipeline;
export import :Device;
export import :HeadlessDevice;
