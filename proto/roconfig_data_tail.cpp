)pbtext";

} // namespace bonds
